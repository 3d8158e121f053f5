#pragma once
#include <string>
#include <utility>

namespace billsync {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    static Result Fail(std::string m) { return Fail(-1, std::move(m)); }
};

} // namespace billsync
