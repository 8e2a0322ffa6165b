#ifndef LIBJSENUM_JSERIAL_HH
#define LIBJSENUM_JSERIAL_HH

#include "jsenum/json.hh"
#include "jsenum/error.hh"
#include "jsenum/serial_context.hh"
#include <type_traits>

namespace jsenum {

// kvt<> wraps a named field
// const_kvt<> wraps a named field that is not dynamic

template <class V> struct kvt {
    const char *key;
    V &&value;
    kvt(const char *k, V &&v) : key(k), value(v) {}
};
template <class V> struct const_kvt : public kvt<V> {
    const_kvt(const char *k, V &&v) : kvt<V>(k, v) {}
};

template <class V> inline kvt<            V&>       kv(const char *k,       V &v) { return {k, v}; }
template <class V> inline kvt<      const V&>       kv(const char *k, const V &v) { return {k, v}; }
template <class V> inline const_kvt<      V&> const_kv(const char *k,       V &v) { return {k, v}; }
template <class V> inline const_kvt<const V&> const_kv(const char *k, const V &v) { return {k, v}; }

// which overload set handles a value type

template <class T> struct uses_codec {
    static constexpr bool value = converter_resolver::can_handle<T>();
};
template <class T> struct uses_traits {
    static constexpr bool value = !uses_codec<T>::value && json_traits<T>::can_cast;
};

enum archive_mode {
    archive_dynamic,
    archive_all
};

//! common state of json_saver and json_loader
class json_archive {
  protected:
    serial_context *_ctx;
    json _j;
    archive_mode _mode;

    json_archive(serial_context &ctx, archive_mode mode)
        : _ctx(&ctx), _mode(mode) {}

  public:
    serial_context &context() const  { return *_ctx; }
    archive_mode mode() const        { return _mode; }

    //! no json here: nothing saved yet, or a missing field when loading
    bool empty() const  { return !_j; }
};


// json_saver

class json_saver : public json_archive {
  public:
    explicit json_saver(serial_context &ctx, archive_mode mode = archive_all)
        : json_archive(ctx, mode) {}

    using is_save    = std::true_type;
    using is_load    = std::false_type;

    friend json result(const json_saver &ar)   { return ar._j; }
    friend json result(      json_saver &&ar)  { return std::move(ar._j); }

    // serialization, main interface
    friend void serialize(json_saver &ar, const json &j) {
        ar.req_empty_for(j);
        ar._j = j;
    }
    template <class T, class Enable = typename std::enable_if<uses_traits<T>::value>::type>
    friend void serialize(json_saver &ar, const T &t) {
        serialize(ar, make_json(t));
    }
    template <class T, class Enable = typename std::enable_if<uses_codec<T>::value>::type, class = void>
    friend void serialize(json_saver &ar, const T &t) {
        serialize(ar, ar.context().codec_for<T>()->write(t));
    }

    // kvt<> and const_kvt<> specialization
    template <class V>
    friend void serialize(json_saver &ar, kvt<V&> f) {
        ar.req_obj_for(f.key);
        json_saver ar2(*ar._ctx, ar._mode);
        serialize(ar2, f.value);
        auto j2(result(std::move(ar2)));
        if (j2)
            ar._j.set(f.key, j2);
    }
    template <class V>
    friend void serialize(json_saver &ar, const_kvt<V&> f) {
        if (ar._mode > archive_dynamic)
            serialize(ar, static_cast<kvt<V&> &>(f));
    }

    // eye candy
    template <class T> json_saver & operator &  (T &t)            { serialize(*this, t); return *this; }
    template <class V> json_saver & operator &  (      kvt<V&> f) { serialize(*this, f); return *this; }
    template <class V> json_saver & operator &  (const_kvt<V&> f) { serialize(*this, f); return *this; }

    template <class T> json_saver & operator << (T &t)            { serialize(*this, t); return *this; }

  protected:
    void req_empty_for(const json &jn) {
        if (_j) throw errorx("json_saver multiple: %s & %s", _j.dump().c_str(), jn.dump().c_str());
    }
    void req_obj_for(const char *key) {
        if (!_j) _j = json::object();
        else if (!_j.is_object()) throw errorx("json_saver key '%s' to non-object: %s", key, _j.dump().c_str());
    }
};


// json_loader

class json_loader : public json_archive {
  public:
    json_loader(serial_context &ctx, const json & j, archive_mode mode = archive_all)
        : json_archive(ctx, mode) { _j = j; }
    json_loader(serial_context &ctx,       json &&j, archive_mode mode = archive_all)
        : json_archive(ctx, mode) { _j = std::move(j); }

    using is_save    = std::false_type;
    using is_load    = std::true_type;

    // serialization, main interface
    friend void serialize(json_loader &ar, json &j) {
        j = ar._j;
    }
    // plain values keep their current value when the field is missing
    template <class T, class Enable = typename std::enable_if<uses_traits<T>::value>::type>
    friend void serialize(json_loader &ar, T &t) {
        if (ar._j)
            t = json_cast<T>(ar._j);
    }
    // codecs decide for themselves what a missing field means
    template <class T, class Enable = typename std::enable_if<uses_codec<T>::value>::type, class = void>
    friend void serialize(json_loader &ar, T &t) {
        t = ar.context().codec_for<T>()->read(ar._j);
    }

    // kvt<> and const_kvt<> specialization
    template <class V>
    friend void serialize(json_loader &ar, kvt<V&> f) {
        ar.req_obj_for(f.key);
        json_loader ar2(*ar._ctx, ar._j[f.key], ar._mode);
        try {
            serialize(ar2, f.value);
        } catch (codec_error &e) {
            e.within(f.key);
            throw;
        }
    }
    template <class V>
    friend void serialize(json_loader &ar, const_kvt<V&> f) {
        if (ar._mode > archive_dynamic)
            serialize(ar, static_cast<kvt<V&> &>(f));
    }

    // eye candy
    template <class T> json_loader & operator &  (T &t)            { serialize(*this, t); return *this; }
    template <class V> json_loader & operator &  (      kvt<V&> f) { serialize(*this, f); return *this; }
    template <class V> json_loader & operator &  (const_kvt<V&> f) { serialize(*this, f); return *this; }

    template <class T> json_loader & operator >> (T &t)            { serialize(*this, t); return *this; }

  protected:
    // a missing record reads as an empty object, so required enums
    // inside it still fail
    void req_obj_for(const char *key) {
        if (_j && !_j.is_object()) throw errorx("json_loader key '%s' from non-object %s", key, _j.dump().c_str());
    }
};


// global functions

template <class T> inline json jsave_all(serial_context &ctx, const T &t) { json_saver ar(ctx, archive_all);     ar << const_cast<T&>(t); return result(std::move(ar)); }
template <class T> inline json jsave_dyn(serial_context &ctx, const T &t) { json_saver ar(ctx, archive_dynamic); ar << const_cast<T&>(t); return result(std::move(ar)); }

template <class T> inline void jload(serial_context &ctx, const json &j, T &t) { json_loader ar(ctx, j); ar >> t; }

//! encode with the context's dump flags
template <class T> inline std::string to_json_string(serial_context &ctx, const T &t) {
    return jsave_all(ctx, t).dump(ctx.dump_flags());
}

//! decode into t; throws errorx for bad JSON text, codec_error for bad values
template <class T> inline void from_json_string(serial_context &ctx, const std::string &s, T &t) {
    jload(ctx, json::load(s), t);
}

} // jsenum

#endif // LIBJSENUM_JSERIAL_HH
