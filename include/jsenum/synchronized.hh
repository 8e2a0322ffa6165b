#ifndef LIBJSENUM_SYNCHRONIZED_HH
#define LIBJSENUM_SYNCHRONIZED_HH

#include <mutex>
#include <type_traits>

namespace jsenum {

//! a value only reachable while holding its mutex
//
//! usage:
//!   synchronized<map<K, V>> m;
//!   auto v = m([&](map<K, V> &mm) { return mm[k]; });
template <typename T, typename Mutex = std::mutex>
class synchronized {
    mutable Mutex _m;
    T _v;

public:
    using mutex_type = Mutex;
    using guard_type = std::lock_guard<Mutex>;

    synchronized() {}

    // This is not quite type-safe, but it can only go wrong if you nest synchronized<>.
    // So don't do that.
    template <typename ...Args>
        explicit synchronized(Args&&... args) : _v(std::forward<Args>(args)...) {}

    synchronized(const synchronized &other) = delete;
    synchronized(synchronized &&other)      = delete;
    synchronized & operator = (const synchronized &other) = delete;
    synchronized & operator = (synchronized &&other)      = delete;

    template <typename Func, typename Ret = typename std::result_of<Func(T&)>::type>
        auto operator () (Func &&f)       -> Ret
            { guard_type g(_m); return f(_v); }

    template <typename Func, typename Ret = typename std::result_of<Func(T&)>::type> // not const T.  on purpose.
        auto operator () (Func &&f) const -> Ret
            { guard_type g(_m); return f(const_cast<T &>(_v)); }
};

} // jsenum

#endif // LIBJSENUM_SYNCHRONIZED_HH
