#pragma once

#include <utility>
#include <core/errors.hpp>

// Wrap fn so that a Locked failure yields `substitute` instead of
// propagating. Any other exception, LockTimeout included, passes through.
//
//   Lock lock("report");
//   auto task = return_when_locked(std::string("already locked"), [&] {
//       return lock.run({}, {false, std::nullopt}, [] { return std::string("done"); });
//   });
//   task();   // "done", or "already locked" when another holder has it
template <typename R, typename Fn>
auto return_when_locked(R substitute, Fn fn) {
    return [substitute = std::move(substitute), fn = std::move(fn)](auto&&... args) -> R {
        try {
            return fn(std::forward<decltype(args)>(args)...);
        } catch (const Locked&) {
            return substitute;
        }
    };
}
