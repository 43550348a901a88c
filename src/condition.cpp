#include "condition.hpp"
#include "coin.hpp"
#include "error.hpp"
#include <algorithm>

namespace coldspend {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void put_u16(std::vector<uint8_t>& out, size_t value) {
    if (value > 0xffff) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, "Condition field too long");
    }
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>(value & 0xff));
}

void put_arg(std::vector<uint8_t>& out, std::span<const uint8_t> arg) {
    put_u16(out, arg.size());
    out.insert(out.end(), arg.begin(), arg.end());
}

// Bounds-checked reader over a solution
class Reader {
public:
    explicit Reader(std::span<const uint8_t> data) : data_(data) {}

    uint8_t u8() {
        need(1);
        return data_[pos_++];
    }

    uint16_t u16() {
        need(2);
        uint16_t value = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return value;
    }

    std::vector<uint8_t> bytes(size_t n) {
        need(n);
        std::vector<uint8_t> out(data_.begin() + pos_, data_.begin() + pos_ + n);
        pos_ += n;
        return out;
    }

    bool done() const { return pos_ == data_.size(); }

private:
    void need(size_t n) const {
        if (data_.size() - pos_ < n) {
            throw SpendError(SpendError::ErrorType::InvalidEncoding, "Truncated solution");
        }
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

uint64_t parse_amount(const std::vector<uint8_t>& bytes) {
    if (bytes.size() > 9 || (bytes.size() == 9 && bytes[0] != 0x00)) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, "Amount out of range");
    }
    if (!bytes.empty() && (bytes[0] & 0x80)) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, "Negative amount");
    }
    if (bytes.size() > 1 && bytes[0] == 0x00 && !(bytes[1] & 0x80)) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, "Non-canonical amount");
    }
    if (bytes.size() == 1 && bytes[0] == 0x00) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, "Non-canonical zero amount");
    }

    uint64_t value = 0;
    for (uint8_t b : bytes) {
        value = (value << 8) | b;
    }
    return value;
}

template <size_t N>
std::array<uint8_t, N> fixed(const std::vector<uint8_t>& bytes, const char* what) {
    if (bytes.size() != N) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, std::string("Bad length for ") + what);
    }
    std::array<uint8_t, N> out;
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

} // namespace

uint8_t Conditions::opcode(const Condition& condition) {
    return std::visit(overloaded{
        [](const CreateCoin&) { return CREATE_COIN; },
        [](const ReserveFee&) { return RESERVE_FEE; },
        [](const CreateCoinAnnouncement&) { return CREATE_COIN_ANNOUNCEMENT; },
        [](const AssertCoinAnnouncement&) { return ASSERT_COIN_ANNOUNCEMENT; },
        [](const AggSigMe&) { return AGG_SIG_ME; }
    }, condition);
}

uint64_t Conditions::cost(const Condition& condition) {
    switch (opcode(condition)) {
        case CREATE_COIN: return CREATE_COIN_COST;
        case AGG_SIG_ME: return AGG_SIG_COST;
        default: return 0;
    }
}

std::vector<uint8_t> Conditions::encode(const std::vector<Condition>& conditions) {
    std::vector<uint8_t> out;
    put_u16(out, conditions.size());

    for (const auto& condition : conditions) {
        out.push_back(opcode(condition));
        std::visit(overloaded{
            [&out](const CreateCoin& c) {
                out.push_back(2);
                put_arg(out, c.puzzle_hash);
                put_arg(out, amount_bytes(c.amount));
            },
            [&out](const ReserveFee& c) {
                out.push_back(1);
                put_arg(out, amount_bytes(c.amount));
            },
            [&out](const CreateCoinAnnouncement& c) {
                out.push_back(1);
                put_arg(out, c.message);
            },
            [&out](const AssertCoinAnnouncement& c) {
                out.push_back(1);
                put_arg(out, c.announcement_id);
            },
            [](const AggSigMe&) {
                throw SpendError(SpendError::ErrorType::InvalidEncoding, "AGG_SIG_ME is emitted by the puzzle, not the solution");
            }
        }, condition);
    }

    return out;
}

std::vector<Condition> Conditions::decode(std::span<const uint8_t> solution) {
    Reader reader(solution);
    uint16_t count = reader.u16();

    std::vector<Condition> conditions;
    conditions.reserve(count);

    for (uint16_t i = 0; i < count; ++i) {
        uint8_t op = reader.u8();
        uint8_t argc = reader.u8();
        std::vector<std::vector<uint8_t>> args;
        for (uint8_t a = 0; a < argc; ++a) {
            args.push_back(reader.bytes(reader.u16()));
        }

        auto expect_args = [&](uint8_t n) {
            if (argc != n) {
                throw SpendError(SpendError::ErrorType::InvalidEncoding,
                    "Condition " + std::to_string(op) + " takes " + std::to_string(n) + " arguments");
            }
        };

        switch (op) {
            case CREATE_COIN:
                expect_args(2);
                conditions.push_back(CreateCoin{fixed<32>(args[0], "puzzle hash"), parse_amount(args[1])});
                break;
            case RESERVE_FEE:
                expect_args(1);
                conditions.push_back(ReserveFee{parse_amount(args[0])});
                break;
            case CREATE_COIN_ANNOUNCEMENT:
                expect_args(1);
                conditions.push_back(CreateCoinAnnouncement{std::move(args[0])});
                break;
            case ASSERT_COIN_ANNOUNCEMENT:
                expect_args(1);
                conditions.push_back(AssertCoinAnnouncement{fixed<32>(args[0], "announcement id")});
                break;
            default:
                throw SpendError(SpendError::ErrorType::InvalidEncoding,
                    "Unsupported condition opcode " + std::to_string(op));
        }
    }

    if (!reader.done()) {
        throw SpendError(SpendError::ErrorType::InvalidEncoding, "Trailing bytes after conditions");
    }
    return conditions;
}

Bytes32 Conditions::announcement_id(const Bytes32& coin_id, std::span<const uint8_t> message) {
    return HashUtils::sha256({coin_id, message});
}

} // namespace coldspend
