#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <thread>
#include <functional>
#include <optional>

namespace objcp::infra {
/*

auto res = infra::with_retry([&]() {
    return backend.transfer(src, dst, options);
}, infra::RetryPolicy{ .max_attempts = 5 });


*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100);
    double backoff_factor = 2.0; // exponential backoff
};

template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {})
    -> decltype(operation())
{
    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;

    for (int attempt = 0; attempt < attempts - 1; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result; // успех
        }

        const auto& err = result.error();
        if (!err.is_transient()) {
            return result;
        }

        auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
            policy.initial_delay * std::pow(policy.backoff_factor, attempt));
        spdlog::debug("Transient error ({}), retrying in {} ms", err.message, delay.count());
        std::this_thread::sleep_for(delay);
    }

    // последняя попытка
    return operation();
}

} // namespace objcp::infra
