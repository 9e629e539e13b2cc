#pragma once

#include <system_error>

#include <serial-actor/detail/unique_function.hpp>

namespace serial_actor {

    /// A unit of deferred work. An empty code means success.
    using task_t = detail::unique_function<std::error_code()>;

} // namespace serial_actor
