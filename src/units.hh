#ifndef units_hh_INCLUDED
#define units_hh_INCLUDED

#include "assert.hh"

#include <compare>
#include <cstddef>
#include <type_traits>

namespace Tabgrid
{

template<typename RealType, typename ValueType = int>
class StronglyTypedNumber
{
public:
    StronglyTypedNumber() = default;

    [[gnu::always_inline]]
    constexpr StronglyTypedNumber(ValueType value)
        : m_value(value)
    {
        static_assert(std::is_base_of<StronglyTypedNumber, RealType>::value,
                     "RealType is not derived from StronglyTypedNumber");
    }

    [[gnu::always_inline]]
    constexpr friend RealType operator+(RealType lhs, RealType rhs)
    { return RealType(lhs.m_value + rhs.m_value); }

    [[gnu::always_inline]]
    constexpr friend RealType operator-(RealType lhs, RealType rhs)
    { return RealType(lhs.m_value - rhs.m_value); }

    [[gnu::always_inline]]
    constexpr friend RealType operator*(RealType lhs, RealType rhs)
    { return RealType(lhs.m_value * rhs.m_value); }

    [[gnu::always_inline]]
    constexpr friend RealType operator/(RealType lhs, RealType rhs)
    { return RealType(lhs.m_value / rhs.m_value); }

    [[gnu::always_inline]]
    constexpr friend RealType operator%(RealType lhs, RealType rhs)
    { return RealType(lhs.m_value % rhs.m_value); }

    RealType& operator+=(RealType other)
    { m_value += other.m_value; return static_cast<RealType&>(*this); }

    RealType& operator-=(RealType other)
    { m_value -= other.m_value; return static_cast<RealType&>(*this); }

    RealType& operator++()
    { ++m_value; return static_cast<RealType&>(*this); }

    RealType& operator--()
    { --m_value; return static_cast<RealType&>(*this); }

    RealType operator++(int)
    { RealType backup(static_cast<RealType&>(*this)); ++m_value; return backup; }

    RealType operator--(int)
    { RealType backup(static_cast<RealType&>(*this)); --m_value; return backup; }

    constexpr RealType operator-() const { return RealType(-m_value); }

    constexpr friend bool operator==(StronglyTypedNumber lhs, StronglyTypedNumber rhs) = default;
    constexpr friend auto operator<=>(StronglyTypedNumber lhs, StronglyTypedNumber rhs) = default;

    constexpr bool operator!() const { return not m_value; }

    [[gnu::always_inline]]
    explicit constexpr operator ValueType() const { return m_value; }
    [[gnu::always_inline]]
    explicit constexpr operator bool() const { return m_value; }

    explicit operator size_t() const { tg_assert(m_value >= 0); return (size_t)m_value; }

protected:
    ValueType m_value;
};

// bytes in an utf-8 string
struct ByteCount : public StronglyTypedNumber<ByteCount, int>
{
    using StronglyTypedNumber::StronglyTypedNumber;
};

[[gnu::always_inline]]
inline constexpr ByteCount operator"" _byte(unsigned long long int value)
{
    return ByteCount(value);
}

template<typename Byte>
    requires (std::is_same_v<std::remove_cv_t<Byte>, char>)
Byte* operator+(Byte* ptr, ByteCount count) { return ptr + (int)count; }

// codepoints, the unit of line and cursor offsets
struct CharCount : public StronglyTypedNumber<CharCount, int>
{
    using StronglyTypedNumber::StronglyTypedNumber;
};

[[gnu::always_inline]]
inline constexpr CharCount operator"" _char(unsigned long long int value)
{
    return CharCount(value);
}

// terminal cells
struct ColumnCount : public StronglyTypedNumber<ColumnCount, int>
{
    using StronglyTypedNumber::StronglyTypedNumber;
};

[[gnu::always_inline]]
inline constexpr ColumnCount operator"" _col(unsigned long long int value)
{
    return ColumnCount(value);
}

// terminal rows
struct LineCount : public StronglyTypedNumber<LineCount, int>
{
    using StronglyTypedNumber::StronglyTypedNumber;
};

[[gnu::always_inline]]
inline constexpr LineCount operator"" _line(unsigned long long int value)
{
    return LineCount(value);
}

}

#endif // units_hh_INCLUDED
