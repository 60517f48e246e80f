#ifndef array_view_hh_INCLUDED
#define array_view_hh_INCLUDED

#include <cstddef>
#include <initializer_list>
#include <type_traits>

namespace Tabgrid
{

// An ArrayView provides a typed, non owning view of a memory
// range with an interface similar to std::vector.
template<typename T, typename SizeType = std::size_t>
class ArrayView
{
public:
    using size_t = std::size_t;

    constexpr ArrayView()
        : m_pointer(nullptr), m_size(0) {}

    template<typename Container>
        requires (sizeof(decltype(*std::declval<Container>().data())) == sizeof(T))
    constexpr ArrayView(Container&& c)
        : m_pointer(c.data()), m_size(c.size()) {}

    constexpr ArrayView(const std::initializer_list<T>& v)
        : m_pointer(v.begin()), m_size(v.size()) {}

    constexpr SizeType size() const { return m_size; }

    [[gnu::always_inline]]
    constexpr T& operator[](SizeType n) const { return *(m_pointer + (size_t)n); }

    constexpr T* begin() const { return m_pointer; }
    constexpr T* end()   const { return m_pointer+m_size; }

    constexpr T& front() const { return *m_pointer; }

    constexpr bool empty() const { return m_size == 0; }

private:
    T* m_pointer;
    SizeType m_size;
};

template<typename T, typename SizeType = std::size_t>
using ConstArrayView = ArrayView<const T, SizeType>;

}

#endif // array_view_hh_INCLUDED
