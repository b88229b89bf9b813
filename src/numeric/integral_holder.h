#ifndef IDPOOL_NUMERIC_INTEGRAL_HOLDER_H_
#define IDPOOL_NUMERIC_INTEGRAL_HOLDER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

#include <boost/multiprecision/cpp_int.hpp>

namespace IdPool {

using BigInteger = boost::multiprecision::cpp_int;

// Value handed out to callers. The alternative matches the holder that produced it.
using Identifier = std::variant<int32_t, int64_t, BigInteger>;

enum class IntegralType {
    kInt32,
    kInt64,
    kBigInteger,
};

const char* IntegralTypeName(IntegralType type);

// Accepts "int32", "int64" and "big_integer". Throws ConfigurationError otherwise.
IntegralType ParseIntegralType(const std::string& name);

std::string IdentifierToString(const Identifier& id);

/**
 * Mutable integer cell used for source values, cursors and upper limits.
 *
 * The allocator only talks to this interface, so the backing representation
 * (fixed width or arbitrary precision) is chosen once at construction time.
 * A freshly made holder is uninitialized; reading it throws HolderError.
 * Binary operations require both holders to share the same IntegralType.
 */
class IntegralHolder {
public:
    virtual ~IntegralHolder() = default;

    virtual IntegralType type() const = 0;
    virtual bool initialized() const = 0;

    virtual IntegralHolder& Initialize(int64_t value) = 0;
    // Parses base-10 text, e.g. a value received over the wire.
    virtual IntegralHolder& Initialize(const std::string& decimal) = 0;

    virtual IntegralHolder& Increment() = 0;
    virtual IntegralHolder& Decrement() = 0;
    virtual IntegralHolder& Add(int64_t addend) = 0;
    virtual IntegralHolder& Subtract(int64_t subtrahend) = 0;

    virtual bool Eq(const IntegralHolder& other) const = 0;
    virtual bool Eq(int64_t value) const = 0;
    virtual bool Lt(const IntegralHolder& other) const = 0;
    virtual bool Lt(int64_t value) const = 0;
    virtual bool Gt(const IntegralHolder& other) const = 0;
    virtual bool Gt(int64_t value) const = 0;

    // (this - other) computed in the holder's own domain, narrowed to int64.
    virtual int64_t Difference(const IntegralHolder& other) const = 0;

    virtual std::unique_ptr<IntegralHolder> Copy() const = 0;

    virtual Identifier MakeValue() const = 0;
    // Snapshot the current value, then advance the cell by one.
    virtual Identifier MakeValueThenIncrement() = 0;
    virtual Identifier MakeValueThenAdd(int64_t addend) = 0;

    virtual std::string ToString() const = 0;
};

std::ostream& operator<<(std::ostream& os, const IntegralHolder& holder);

/**
 * Holder backed by a machine integer. Every arithmetic step is overflow
 * checked; leaving the range of T throws HolderError instead of wrapping.
 */
template<typename T>
class FixedWidthHolder final : public IntegralHolder {
public:
    FixedWidthHolder() = default;
    explicit FixedWidthHolder(T value) : value_(value) {}

    IntegralType type() const override;
    bool initialized() const override { return value_.has_value(); }

    IntegralHolder& Initialize(int64_t value) override;
    IntegralHolder& Initialize(const std::string& decimal) override;

    IntegralHolder& Increment() override { return Add(1); }
    IntegralHolder& Decrement() override { return Subtract(1); }
    IntegralHolder& Add(int64_t addend) override;
    IntegralHolder& Subtract(int64_t subtrahend) override;

    bool Eq(const IntegralHolder& other) const override;
    bool Eq(int64_t value) const override;
    bool Lt(const IntegralHolder& other) const override;
    bool Lt(int64_t value) const override;
    bool Gt(const IntegralHolder& other) const override;
    bool Gt(int64_t value) const override;

    int64_t Difference(const IntegralHolder& other) const override;

    std::unique_ptr<IntegralHolder> Copy() const override;

    Identifier MakeValue() const override;
    Identifier MakeValueThenIncrement() override;
    Identifier MakeValueThenAdd(int64_t addend) override;

    std::string ToString() const override;

private:
    T Checked() const;
    const FixedWidthHolder& SameType(const IntegralHolder& other) const;

    std::optional<T> value_;
};

using Int32Holder = FixedWidthHolder<int32_t>;
using Int64Holder = FixedWidthHolder<int64_t>;

/**
 * Arbitrary precision holder. Never overflows.
 */
class BigIntegerHolder final : public IntegralHolder {
public:
    BigIntegerHolder() = default;
    explicit BigIntegerHolder(BigInteger value) : value_(std::move(value)) {}

    IntegralType type() const override { return IntegralType::kBigInteger; }
    bool initialized() const override { return value_.has_value(); }

    IntegralHolder& Initialize(int64_t value) override;
    IntegralHolder& Initialize(const std::string& decimal) override;

    IntegralHolder& Increment() override { return Add(1); }
    IntegralHolder& Decrement() override { return Subtract(1); }
    IntegralHolder& Add(int64_t addend) override;
    IntegralHolder& Subtract(int64_t subtrahend) override;

    bool Eq(const IntegralHolder& other) const override;
    bool Eq(int64_t value) const override;
    bool Lt(const IntegralHolder& other) const override;
    bool Lt(int64_t value) const override;
    bool Gt(const IntegralHolder& other) const override;
    bool Gt(int64_t value) const override;

    int64_t Difference(const IntegralHolder& other) const override;

    std::unique_ptr<IntegralHolder> Copy() const override;

    Identifier MakeValue() const override;
    Identifier MakeValueThenIncrement() override;
    Identifier MakeValueThenAdd(int64_t addend) override;

    std::string ToString() const override;

private:
    const BigInteger& Checked() const;
    const BigIntegerHolder& SameType(const IntegralHolder& other) const;

    std::optional<BigInteger> value_;
};

// Creates an uninitialized holder of the given representation.
std::unique_ptr<IntegralHolder> MakeHolder(IntegralType type);
std::unique_ptr<IntegralHolder> MakeHolder(IntegralType type, int64_t initial_value);

} // namespace IdPool

#endif // IDPOOL_NUMERIC_INTEGRAL_HOLDER_H_
