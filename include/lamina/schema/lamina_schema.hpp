#pragma once
// lamina_schema.hpp (C++17-only, header-only)
// -----------------------------------------------------------------------------
// Tiny declarative toolkit for validating parameter structs.
//
// Usage sketch:
//   struct Params { double speed; int passes; };
//   using namespace lamina::schema;
//   const auto fields = std::make_tuple(
//       field<&Params::speed >("speed" , Finite{}, Positive{}),
//       field<&Params::passes>("passes", AtLeast<1>{})
//   );
//   const auto schema = makeSchema<Params>(fields, objectValidator([](const Params& p)
//       -> expected<void, ConfigurationError> {
//       if (p.passes > 8) return unexpected<ConfigurationError>({"passes","too many"});
//       return {};
//   }));
//   auto ok = validate(schema, params);
//
// Depends on: TartanLlama expected (single header):  tl/expected.hpp
// -----------------------------------------------------------------------------

#include <cmath>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

#include "lamina/core/Errors.hpp"

namespace lamina::schema {

template<class T, class E>
using expected = tl::expected<T, E>;
template<class E>
using unexpected = tl::unexpected<E>;

using ValidationResult = expected<void, ConfigurationError>;

namespace detail {

template<class U>
ConfigurationError reject(const char* where, const U& value, const char* rule) {
    std::ostringstream msg;
    msg << rule << " (got " << value << ")";
    return {where, msg.str()};
}

} // namespace detail

// ============================================================================
// Validators
// ============================================================================
struct Finite {
    template<class U>
    ValidationResult operator()(const char* where, const U& v) const {
        if constexpr (std::is_floating_point<U>::value) {
            if (!std::isfinite(v)) return unexpected<ConfigurationError>(detail::reject(where, v, "must be finite"));
        }
        return {};
    }
};

struct Positive {
    template<class U>
    ValidationResult operator()(const char* where, const U& v) const {
        // Written as !(v > 0) so NaN is rejected too.
        if (!(v > U{0})) return unexpected<ConfigurationError>(detail::reject(where, v, "must be positive"));
        return {};
    }
};

template<long long Min>
struct AtLeast {
    template<class U>
    ValidationResult operator()(const char* where, const U& v) const {
        static_assert(std::is_integral<U>::value, "AtLeast applies to integral fields");
        if (static_cast<long long>(v) < Min) {
            std::ostringstream rule;
            rule << "must be at least " << Min;
            return unexpected<ConfigurationError>(detail::reject(where, v, rule.str().c_str()));
        }
        return {};
    }
};

// ============================================================================
// Field descriptor + helper
// ============================================================================
template<auto MemberPtr, class... Validators>
struct Field {
    static constexpr auto memberPtr = MemberPtr;
    const char* name;
    std::tuple<Validators...> validators;
};

template<auto MemberPtr, class... Validators>
Field<MemberPtr, Validators...>
field(const char* name, Validators... vs) {
    return { name, std::tuple<Validators...>{vs...} };
}

// ============================================================================
// Object-level validator
// ============================================================================
template<class Fn>
struct ObjectValidator { Fn fn; };

template<class Fn>
ObjectValidator<Fn> objectValidator(Fn fn) { return ObjectValidator<Fn>{fn}; }

template<class T>
struct NoObjectValidator {
    struct Pass {
        ValidationResult operator()(const T&) const { return {}; }
    };
    Pass fn;
};

// ============================================================================
// Schema
// ============================================================================
template<class T, class FieldsTuple, class ObjValidator>
struct Schema {
    FieldsTuple  fields;
    ObjValidator objValidator;
};

template<class T, class... FieldDescs>
Schema<T, std::tuple<FieldDescs...>, NoObjectValidator<T>>
makeSchema(std::tuple<FieldDescs...> fds) {
    return { std::move(fds), NoObjectValidator<T>{} };
}

template<class T, class... FieldDescs, class Fn>
Schema<T, std::tuple<FieldDescs...>, ObjectValidator<Fn>>
makeSchema(std::tuple<FieldDescs...> fds, ObjectValidator<Fn> ov) {
    return { std::move(fds), ov };
}

// ============================================================================
// Field validation helper: validators in declaration order, first failure wins
// ============================================================================
namespace detail {

template<class FieldDesc, class V>
ValidationResult runFieldValidators(const FieldDesc& fd, const V& v) {
    ValidationResult ok{};
    std::apply([&](auto const&... check){
        ( ( [&](){
            if (!ok) return;
            if (auto r = check(fd.name, v); !r) ok = unexpected<ConfigurationError>(r.error());
        }() ), ... );
    }, fd.validators);
    return ok;
}

} // namespace detail

// ============================================================================
// validate: fields in declaration order, first failure wins, then the
// object-level rules
// ============================================================================
template<class T, class FieldsTuple, class ObjValidatorT>
ValidationResult validate(const Schema<T, FieldsTuple, ObjValidatorT>& sch, const T& obj) {
    bool failed = false;
    ConfigurationError err;

    std::apply([&](auto const&... fd){
        ( ( [&](){
            if (failed) return;
            if (auto ok = detail::runFieldValidators(fd, obj.*(fd.memberPtr)); !ok) {
                failed = true; err = ok.error();
            }
        }() ), ... );
    }, sch.fields);

    if (failed) return unexpected<ConfigurationError>(err);

    return sch.objValidator.fn(obj);
}

} // namespace lamina::schema
