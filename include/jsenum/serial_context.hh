#ifndef LIBJSENUM_SERIAL_CONTEXT_HH
#define LIBJSENUM_SERIAL_CONTEXT_HH

#include "jsenum/converter_resolver.hh"
#include "jsenum/logging.hh"
#include <atomic>
#include <memory>
#include <typeindex>
#include <unordered_map>

namespace jsenum {

//! state shared by the archives of one serialization setup
//
//! owns the name table registry and a type -> codec cache, so the
//! resolver runs once per distinct field type. separate contexts share
//! nothing; tests make one each.
class serial_context {
    name_table_registry _tables;
    converter_resolver _resolver;
    synchronized<std::unordered_map<std::type_index, std::shared_ptr<const void>>> _codecs;
    std::atomic<unsigned> _dump_flags;

public:
    static constexpr unsigned default_dump_flags = JSON_ENCODE_ANY | JSON_COMPACT | JSON_PRESERVE_ORDER;

    explicit serial_context(unsigned dump_flags = default_dump_flags)
        : _resolver(_tables), _dump_flags(dump_flags) {}

    serial_context(const serial_context &) = delete;
    serial_context & operator = (const serial_context &) = delete;

    name_table_registry &tables()             { return _tables; }
    const converter_resolver &resolver() const { return _resolver; }

    //! Jansson encoding flags for to_json_string(), may change while in use
    unsigned dump_flags() const          { return _dump_flags.load(); }
    void set_dump_flags(unsigned flags)  { _dump_flags.store(flags); }

    //! cached codec for T, nullptr when no codec applies to T
    template <class T>
    std::shared_ptr<const value_codec<T>> codec_for() {
        const std::type_index key(typeid(T));
        auto cached = _codecs([&](std::unordered_map<std::type_index, std::shared_ptr<const void>> &m) {
            const auto it = m.find(key);
            return it == m.end() ? std::shared_ptr<const void>() : it->second;
        });
        if (cached)
            return std::static_pointer_cast<const value_codec<T>>(cached);

        // resolve outside the cache lock; the registry has its own.
        // two threads may both resolve, the first insert wins.
        std::shared_ptr<const value_codec<T>> codec = _resolver.resolve<T>();
        if (!codec)
            return codec;
        VLOG(2) << "resolved codec for " << typeid(T).name();
        auto kept = _codecs([&](std::unordered_map<std::type_index, std::shared_ptr<const void>> &m) {
            return m.emplace(key, codec).first->second;
        });
        return std::static_pointer_cast<const value_codec<T>>(kept);
    }

    size_t cached_codecs() const {
        return _codecs([](std::unordered_map<std::type_index, std::shared_ptr<const void>> &m) {
            return m.size();
        });
    }
};

} // jsenum

#endif // LIBJSENUM_SERIAL_CONTEXT_HH
