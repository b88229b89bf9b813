#include "integral_holder.h"

#include <cctype>
#include <limits>
#include <type_traits>
#include <utility>

#include "common/errors.h"

namespace IdPool {

const char* IntegralTypeName(IntegralType type) {
    switch (type) {
        case IntegralType::kInt32:
            return "int32";
        case IntegralType::kInt64:
            return "int64";
        case IntegralType::kBigInteger:
            return "big_integer";
    }
    return "unknown";
}

IntegralType ParseIntegralType(const std::string& name) {
    if (name == "int32") return IntegralType::kInt32;
    if (name == "int64") return IntegralType::kInt64;
    if (name == "big_integer") return IntegralType::kBigInteger;
    throw ConfigurationError("Unknown identifier type '" + name +
                             "' (expected int32, int64 or big_integer)");
}

std::string IdentifierToString(const Identifier& id) {
    return std::visit([](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, BigInteger>) {
            return v.str();
        } else {
            return std::to_string(v);
        }
    }, id);
}

std::ostream& operator<<(std::ostream& os, const IntegralHolder& holder) {
    return os << holder.ToString();
}

namespace {

// Base-10 with an optional leading minus sign, nothing else.
bool IsDecimalText(const std::string& text) {
    size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (start == text.size()) return false;
    for (size_t i = start; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    return true;
}

[[noreturn]] void ThrowUninitialized() {
    throw HolderError("Integral holder was not initialized");
}

[[noreturn]] void ThrowTypeMismatch(const IntegralHolder& lhs, const IntegralHolder& rhs) {
    throw HolderError(std::string("Cannot combine ") + IntegralTypeName(lhs.type()) +
                      " holder with " + IntegralTypeName(rhs.type()) + " holder");
}

} // namespace

// FixedWidthHolder ------------------------------------------------------------

template<typename T>
IntegralType FixedWidthHolder<T>::type() const {
    if constexpr (std::is_same_v<T, int32_t>) {
        return IntegralType::kInt32;
    } else {
        return IntegralType::kInt64;
    }
}

template<typename T>
T FixedWidthHolder<T>::Checked() const {
    if (!value_.has_value()) ThrowUninitialized();
    return *value_;
}

template<typename T>
const FixedWidthHolder<T>& FixedWidthHolder<T>::SameType(const IntegralHolder& other) const {
    const auto* typed = dynamic_cast<const FixedWidthHolder<T>*>(&other);
    if (typed == nullptr) ThrowTypeMismatch(*this, other);
    return *typed;
}

template<typename T>
IntegralHolder& FixedWidthHolder<T>::Initialize(int64_t value) {
    if (value < std::numeric_limits<T>::min() || value > std::numeric_limits<T>::max()) {
        throw HolderError("Value " + std::to_string(value) + " does not fit in " +
                          IntegralTypeName(type()));
    }
    value_ = static_cast<T>(value);
    return *this;
}

template<typename T>
IntegralHolder& FixedWidthHolder<T>::Initialize(const std::string& decimal) {
    if (!IsDecimalText(decimal)) {
        throw HolderError("Not a decimal integer: '" + decimal + "'");
    }
    int64_t parsed;
    try {
        parsed = std::stoll(decimal);
    } catch (const std::out_of_range&) {
        throw HolderError("Value " + decimal + " does not fit in " + IntegralTypeName(type()));
    }
    return Initialize(parsed);
}

template<typename T>
IntegralHolder& FixedWidthHolder<T>::Add(int64_t addend) {
    T result;
    if (__builtin_add_overflow(Checked(), addend, &result)) {
        throw HolderError(std::string(IntegralTypeName(type())) + " overflow adding " +
                          std::to_string(addend) + " to " + ToString());
    }
    value_ = result;
    return *this;
}

template<typename T>
IntegralHolder& FixedWidthHolder<T>::Subtract(int64_t subtrahend) {
    T result;
    if (__builtin_sub_overflow(Checked(), subtrahend, &result)) {
        throw HolderError(std::string(IntegralTypeName(type())) + " overflow subtracting " +
                          std::to_string(subtrahend) + " from " + ToString());
    }
    value_ = result;
    return *this;
}

template<typename T>
bool FixedWidthHolder<T>::Eq(const IntegralHolder& other) const {
    return Checked() == SameType(other).Checked();
}

template<typename T>
bool FixedWidthHolder<T>::Eq(int64_t value) const {
    return static_cast<int64_t>(Checked()) == value;
}

template<typename T>
bool FixedWidthHolder<T>::Lt(const IntegralHolder& other) const {
    return Checked() < SameType(other).Checked();
}

template<typename T>
bool FixedWidthHolder<T>::Lt(int64_t value) const {
    return static_cast<int64_t>(Checked()) < value;
}

template<typename T>
bool FixedWidthHolder<T>::Gt(const IntegralHolder& other) const {
    return Checked() > SameType(other).Checked();
}

template<typename T>
bool FixedWidthHolder<T>::Gt(int64_t value) const {
    return static_cast<int64_t>(Checked()) > value;
}

template<typename T>
int64_t FixedWidthHolder<T>::Difference(const IntegralHolder& other) const {
    int64_t result;
    if (__builtin_sub_overflow(static_cast<int64_t>(Checked()),
                               static_cast<int64_t>(SameType(other).Checked()), &result)) {
        throw HolderError("Difference between " + ToString() + " and " + other.ToString() +
                          " does not fit in int64");
    }
    return result;
}

template<typename T>
std::unique_ptr<IntegralHolder> FixedWidthHolder<T>::Copy() const {
    auto copy = std::make_unique<FixedWidthHolder<T>>();
    copy->value_ = value_;
    return copy;
}

template<typename T>
Identifier FixedWidthHolder<T>::MakeValue() const {
    return Identifier(std::in_place_type<T>, Checked());
}

template<typename T>
Identifier FixedWidthHolder<T>::MakeValueThenIncrement() {
    Identifier result = MakeValue();
    Increment();
    return result;
}

template<typename T>
Identifier FixedWidthHolder<T>::MakeValueThenAdd(int64_t addend) {
    Identifier result = MakeValue();
    Add(addend);
    return result;
}

template<typename T>
std::string FixedWidthHolder<T>::ToString() const {
    if (!value_.has_value()) return "<uninitialized>";
    return std::to_string(*value_);
}

template class FixedWidthHolder<int32_t>;
template class FixedWidthHolder<int64_t>;

// BigIntegerHolder ------------------------------------------------------------

const BigInteger& BigIntegerHolder::Checked() const {
    if (!value_.has_value()) ThrowUninitialized();
    return *value_;
}

const BigIntegerHolder& BigIntegerHolder::SameType(const IntegralHolder& other) const {
    const auto* typed = dynamic_cast<const BigIntegerHolder*>(&other);
    if (typed == nullptr) ThrowTypeMismatch(*this, other);
    return *typed;
}

IntegralHolder& BigIntegerHolder::Initialize(int64_t value) {
    value_ = BigInteger(value);
    return *this;
}

IntegralHolder& BigIntegerHolder::Initialize(const std::string& decimal) {
    if (!IsDecimalText(decimal)) {
        throw HolderError("Not a decimal integer: '" + decimal + "'");
    }
    value_ = BigInteger(decimal);
    return *this;
}

IntegralHolder& BigIntegerHolder::Add(int64_t addend) {
    BigInteger next = Checked() + addend;
    value_ = std::move(next);
    return *this;
}

IntegralHolder& BigIntegerHolder::Subtract(int64_t subtrahend) {
    BigInteger next = Checked() - subtrahend;
    value_ = std::move(next);
    return *this;
}

bool BigIntegerHolder::Eq(const IntegralHolder& other) const {
    return Checked() == SameType(other).Checked();
}

bool BigIntegerHolder::Eq(int64_t value) const {
    return Checked() == value;
}

bool BigIntegerHolder::Lt(const IntegralHolder& other) const {
    return Checked() < SameType(other).Checked();
}

bool BigIntegerHolder::Lt(int64_t value) const {
    return Checked() < value;
}

bool BigIntegerHolder::Gt(const IntegralHolder& other) const {
    return Checked() > SameType(other).Checked();
}

bool BigIntegerHolder::Gt(int64_t value) const {
    return Checked() > value;
}

int64_t BigIntegerHolder::Difference(const IntegralHolder& other) const {
    BigInteger diff = Checked() - SameType(other).Checked();
    if (diff > std::numeric_limits<int64_t>::max() || diff < std::numeric_limits<int64_t>::min()) {
        throw HolderError("Difference between " + ToString() + " and " + other.ToString() +
                          " does not fit in int64");
    }
    return diff.convert_to<int64_t>();
}

std::unique_ptr<IntegralHolder> BigIntegerHolder::Copy() const {
    auto copy = std::make_unique<BigIntegerHolder>();
    copy->value_ = value_;
    return copy;
}

Identifier BigIntegerHolder::MakeValue() const {
    return Identifier(std::in_place_type<BigInteger>, Checked());
}

Identifier BigIntegerHolder::MakeValueThenIncrement() {
    Identifier result = MakeValue();
    Increment();
    return result;
}

Identifier BigIntegerHolder::MakeValueThenAdd(int64_t addend) {
    Identifier result = MakeValue();
    Add(addend);
    return result;
}

std::string BigIntegerHolder::ToString() const {
    if (!value_.has_value()) return "<uninitialized>";
    return value_->str();
}

// Factory ---------------------------------------------------------------------

std::unique_ptr<IntegralHolder> MakeHolder(IntegralType type) {
    switch (type) {
        case IntegralType::kInt32:
            return std::make_unique<Int32Holder>();
        case IntegralType::kInt64:
            return std::make_unique<Int64Holder>();
        case IntegralType::kBigInteger:
            return std::make_unique<BigIntegerHolder>();
    }
    throw HolderError("Unsupported integral type");
}

std::unique_ptr<IntegralHolder> MakeHolder(IntegralType type, int64_t initial_value) {
    auto holder = MakeHolder(type);
    holder->Initialize(initial_value);
    return holder;
}

} // namespace IdPool
