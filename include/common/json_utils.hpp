#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace nlohmann {

template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(Keys &&... keys) {
    std::string msg = "Missing or unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg.pop_back();
    return std::invalid_argument(msg);
}

/**
 * @brief 读取 j[keys...]，不存在或类型不对时抛出 std::invalid_argument
 * @note 异常信息只包含键名，不会包含 j 的内容
 */
template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null())
        throw build_invalid_argument(keys...);
    try {
        return ref->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(keys...);
    }
}

/**
 * @brief 读取 j[keys...]，不存在时返回 def_value，类型不对时抛出 std::invalid_argument
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(keys...);
    }
}

}  // namespace nlohmann
