#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <utility>

#include "core/types.hpp"

namespace flowstab::pipeline {

// Output port: receives each produced item synchronously.
template <typename Out>
using Emit = std::function<FlowResult(Out)>;

// A push-driven processing step. consume() runs to completion, emitting zero
// or more items before it returns.
template <typename In, typename Out>
class Stage {
public:
    using Input = In;
    using Output = Out;
    using EmitFn = Emit<Out>;

    virtual ~Stage() = default;

    virtual const char* name() const = 0;
    virtual FlowResult consume(In item, const EmitFn& emit) = 0;

    const std::string& lastError() const { return last_error_; }

protected:
    FlowResult fail(std::string error) {
        std::cerr << '[' << name() << "] " << error << '\n';
        last_error_ = std::move(error);
        return FlowResult::Error;
    }

private:
    std::string last_error_;
};

}  // namespace flowstab::pipeline
