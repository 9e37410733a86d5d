#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shardwire/core/http/method.hpp"


namespace shardwire::core::http {

/*
===============================================================================
 http::Route
===============================================================================

A request target described by its method, its path template and the values
substituted into it.

  route_class()  -> "GET /channels/{channel_id}/messages"
                    identifies the rate-limit class before the server bucket
                    is known
  major_key()    -> "channel_id=123"
                    major parameters split one server bucket into independent
                    limits (guild, channel, webhook)
  path()         -> "/channels/123/messages"

Routes that are exempt from the process-wide limit set ignore_global.
===============================================================================
*/

class Route {
public:
    using Parameters = std::vector<std::pair<std::string, std::string>>;

    Route(Method method, std::string path_template, Parameters params = {}, bool ignore_global = false)
        : method_(method)
        , template_(std::move(path_template))
        , params_(std::move(params))
        , ignore_global_(ignore_global)
    {
        path_ = format_path_();
        major_ = format_major_();
    }

    [[nodiscard]] inline Method method() const noexcept { return method_; }
    [[nodiscard]] inline const std::string& path_template() const noexcept { return template_; }
    [[nodiscard]] inline const std::string& path() const noexcept { return path_; }
    [[nodiscard]] inline const std::string& major_key() const noexcept { return major_; }
    [[nodiscard]] inline bool ignore_global() const noexcept { return ignore_global_; }

    [[nodiscard]]
    inline std::string route_class() const {
        std::string out(to_string(method_));
        out += ' ';
        out += template_;
        return out;
    }

private:
    [[nodiscard]]
    static bool is_major_(std::string_view name) noexcept {
        return name == "guild_id" || name == "channel_id" || name == "webhook_id" || name == "webhook_token";
    }

    [[nodiscard]]
    inline std::string format_path_() const {
        std::string out;
        out.reserve(template_.size() + 32);
        std::size_t pos = 0;
        while (pos < template_.size()) {
            const auto open = template_.find('{', pos);
            if (open == std::string::npos) {
                out.append(template_, pos, std::string::npos);
                break;
            }
            const auto close = template_.find('}', open);
            if (close == std::string::npos) {
                out.append(template_, pos, std::string::npos);
                break;
            }
            out.append(template_, pos, open - pos);
            const std::string_view name(template_.data() + open + 1, close - open - 1);
            bool substituted = false;
            for (const auto& [k, v] : params_) {
                if (k == name) {
                    out += v;
                    substituted = true;
                    break;
                }
            }
            if (!substituted) { // keep the placeholder verbatim
                out.append(template_, open, close - open + 1);
            }
            pos = close + 1;
        }
        return out;
    }

    [[nodiscard]]
    inline std::string format_major_() const {
        std::string out;
        for (const auto& [k, v] : params_) {
            if (!is_major_(k)) {
                continue;
            }
            if (!out.empty()) {
                out += ';';
            }
            out += k;
            out += '=';
            out += v;
        }
        return out;
    }

private:
    Method method_;
    std::string template_;
    Parameters params_;
    bool ignore_global_;
    std::string path_;
    std::string major_;
};

} // namespace shardwire::core::http
