#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ck/core/Error.hpp"

namespace ck::schema {

/**
 * @brief Outcome of validating one raw JSON value against one shape.
 *
 * Either holds the coerced value or the reason the value was rejected.
 */
template <typename T>
class CheckResult {
public:
    static CheckResult Success(T value) {
        CheckResult result;
        result.m_value.emplace(std::move(value));
        return result;
    }

    static CheckResult Failure(std::string reason, std::string path = {}) {
        CheckResult result;
        result.m_reason = std::move(reason);
        result.m_path = std::move(path);
        return result;
    }

    bool Ok() const { return m_value.has_value(); }
    explicit operator bool() const { return Ok(); }

    const T& Value() const { return *m_value; }
    T TakeValue() { return std::move(*m_value); }
    const std::string& Reason() const { return m_reason; }
    // Where below the checked value the failure happened, e.g. "[1].obj_id".
    const std::string& Path() const { return m_path; }

private:
    CheckResult() = default;

    std::optional<T> m_value;
    std::string m_reason;
    std::string m_path;
};

// "object_list" + "[1].obj_id" -> "object_list[1].obj_id"
inline std::string JoinFieldPath(std::string_view parent, std::string_view child) {
    if (child.empty()) {
        return std::string(parent);
    }
    if (parent.empty() || child.front() == '[') {
        return fmt::format("{}{}", parent, child);
    }
    return fmt::format("{}.{}", parent, child);
}

template <typename T>
using Check = std::function<CheckResult<T>(const nlohmann::json&)>;

// One named entry of an alternative-check chain.
template <typename R>
struct Alternative {
    std::string shape;
    Check<R> check;
};

template <typename R>
using AlternativeChain = std::vector<Alternative<R>>;

// Primitive checks. Numbers must be integral and fit in 64 bits to pass CheckInt.
CheckResult<bool> CheckBool(const nlohmann::json& value);
CheckResult<std::int64_t> CheckInt(const nlohmann::json& value);
CheckResult<std::string> CheckString(const nlohmann::json& value);
CheckResult<std::monostate> CheckNull(const nlohmann::json& value);

// A string run through the boolean-word recognizer (see utils::StrToBool).
CheckResult<bool> CheckBoolWord(const nlohmann::json& value);

// Throwing forms: return the value or raise TypeMismatchError naming the expected kind.
bool ExpectBool(const nlohmann::json& value);
std::int64_t ExpectInt(const nlohmann::json& value);
std::string ExpectString(const nlohmann::json& value);
void ExpectNull(const nlohmann::json& value);

template <typename T>
CheckResult<std::vector<T>> CheckList(const Check<T>& element, const nlohmann::json& value) {
    if (!value.is_array()) {
        return CheckResult<std::vector<T>>::Failure(
            fmt::format("expected array, got {}", value.type_name()));
    }
    std::vector<T> items;
    items.reserve(value.size());
    for (std::size_t index = 0; index < value.size(); ++index) {
        auto item = element(value[index]);
        if (!item) {
            return CheckResult<std::vector<T>>::Failure(
                fmt::format("element [{}]: {}", index, item.Reason()),
                JoinFieldPath(fmt::format("[{}]", index), item.Path()));
        }
        items.push_back(item.TakeValue());
    }
    return CheckResult<std::vector<T>>::Success(std::move(items));
}

template <typename T>
std::vector<T> ExpectList(const Check<T>& element, const nlohmann::json& value) {
    auto result = CheckList(element, value);
    if (!result) {
        throw ck::core::TypeMismatchError(result.Path(), value.dump(), {"list"}, result.Reason());
    }
    return result.TakeValue();
}

template <typename T>
Check<std::vector<T>> ListOf(Check<T> element) {
    return [element = std::move(element)](const nlohmann::json& value) {
        return CheckList(element, value);
    };
}

/**
 * @brief Adapts a throwing decoder into a Check.
 *
 * Only TypeMismatchError is turned into a failed result; every other error
 * keeps propagating so that, for example, a missing path is never mistaken
 * for "try the next shape".
 */
template <typename T, typename Decoder>
Check<T> FromDecoder(Decoder decoder) {
    return [decoder = std::move(decoder)](const nlohmann::json& value) -> CheckResult<T> {
        try {
            return CheckResult<T>::Success(decoder(value));
        } catch (const ck::core::TypeMismatchError& e) {
            return CheckResult<T>::Failure(e.what(), std::string(e.field()));
        }
    };
}

template <typename R>
std::vector<std::string> ShapesOf(const AlternativeChain<R>& chain) {
    std::vector<std::string> shapes;
    shapes.reserve(chain.size());
    for (const auto& alternative : chain) {
        shapes.push_back(alternative.shape);
    }
    return shapes;
}

// Tries each alternative in order; the first success wins. On failure the path
// of the first alternative that got past the top-level value is kept.
template <typename R>
CheckResult<R> CheckOneOf(const AlternativeChain<R>& chain, const nlohmann::json& value) {
    std::string reasons;
    std::string path;
    for (const auto& alternative : chain) {
        auto result = alternative.check(value);
        if (result) {
            return result;
        }
        if (!reasons.empty()) {
            reasons.append("; ");
        }
        reasons.append(fmt::format("{}: {}", alternative.shape, result.Reason()));
        if (path.empty()) {
            path = result.Path();
        }
    }
    return CheckResult<R>::Failure(std::move(reasons), std::move(path));
}

template <typename R>
R ExpectOneOf(const AlternativeChain<R>& chain,
              const nlohmann::json& value,
              std::string_view field = {}) {
    auto result = CheckOneOf(chain, value);
    if (!result) {
        throw ck::core::TypeMismatchError(JoinFieldPath(field, result.Path()), value.dump(),
                                          ShapesOf(chain), result.Reason());
    }
    return result.TakeValue();
}

// Chain entry accepting only null/absent, producing an empty optional.
template <typename T>
Alternative<std::optional<T>> NullAlternative() {
    return {"null", [](const nlohmann::json& value) {
                auto result = CheckNull(value);
                if (!result) {
                    return CheckResult<std::optional<T>>::Failure(result.Reason(), result.Path());
                }
                return CheckResult<std::optional<T>>::Success(std::nullopt);
            }};
}

// Chain entry wrapping @p check so its value lands in an engaged optional.
template <typename T>
Alternative<std::optional<T>> PresentAlternative(std::string shape, Check<T> check) {
    return {std::move(shape), [check = std::move(check)](const nlohmann::json& value) {
                auto result = check(value);
                if (!result) {
                    return CheckResult<std::optional<T>>::Failure(result.Reason(), result.Path());
                }
                return CheckResult<std::optional<T>>::Success(std::optional<T>(result.TakeValue()));
            }};
}

} // namespace ck::schema
