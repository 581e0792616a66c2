#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/hearth_errors.hpp"
#include "runtime/execution_context.hpp"

namespace hearth::tools {

// A callable the model can request by name. invoke() runs on a worker
// thread owned by the dispatcher and should poll ctx.is_cancelled() at
// convenient points. Error results become "Error: <message>" text, except
// Configuration errors, which abort the whole dispatch.
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    virtual core::errors::Result<std::string> invoke(const nlohmann::json& args,
                                                     const runtime::ExecutionContext& ctx) = 0;
};

}  // namespace hearth::tools
