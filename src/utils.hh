#ifndef utils_hh_INCLUDED
#define utils_hh_INCLUDED

#include "assert.hh"

#include <type_traits>
#include <utility>

namespace Tabgrid
{

// *** On scope end ***
//
// on_scope_end provides a way to register some code to be
// executed when current scope closes.
//
// usage:
// auto cleaner = on_scope_end([]() { ... });
//
// This permits to cleanup c-style resources without implementing
// a wrapping class
template<typename T>
class [[nodiscard]] OnScopeEnd
{
public:
    [[gnu::always_inline]]
    OnScopeEnd(T func) : m_valid{true}, m_func{std::move(func)} {}

    [[gnu::always_inline]]
    OnScopeEnd(OnScopeEnd&& other)
      : m_valid{other.m_valid}, m_func{std::move(other.m_func)}
    { other.m_valid = false; }

    [[gnu::always_inline]]
    ~OnScopeEnd() noexcept(noexcept(std::declval<T>()())) { if (m_valid) m_func(); }

private:
    bool m_valid;
    T m_func;
};

template<typename T>
OnScopeEnd<T> on_scope_end(T t)
{
    return OnScopeEnd<T>{std::move(t)};
}

template<typename T>
const T& clamp(const T& val, const T& min, const T& max)
{
    return (val < min ? min : (val > max ? max : val));
}

template<typename> class FunctionRef;

template<typename From, typename To>
concept ConvertibleTo = std::is_convertible_v<From, To>;

template<typename Res, typename... Args>
class FunctionRef<Res(Args...)>
{
public:
    template<typename Target>
        requires requires (Target t, Args... a) {
            requires not std::is_same_v<FunctionRef, std::remove_cvref_t<Target>>;
            { t(a...) } -> ConvertibleTo<Res>;
        }
    FunctionRef(Target&& target)
      : m_target{&target},
        m_invoker{[](void* target, Args... args) {
            return (*reinterpret_cast<std::remove_reference_t<Target>*>(target))(static_cast<Args>(args)...);
        }}
    {}

    Res operator()(Args... args) const
    {
        return m_invoker(m_target, static_cast<Args>(args)...);
    }

private:
    using Invoker = Res (void*, Args...);
    void* m_target;
    Invoker* m_invoker;
};

}

#endif // utils_hh_INCLUDED
