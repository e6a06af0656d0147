// VEIL - Circuit Environment
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/circuit/environment.h"
#include "veil/core/errors.h"
#include "veil/util/logging.h"

namespace veil {
namespace circuit {

namespace {

struct ConstraintLog {
    size_t constants{0};
    size_t publics{0};
    size_t privates{0};
    size_t constraints{0};
    bool satisfied{true};
    std::string firstViolation;
};

ConstraintLog& Log() {
    thread_local ConstraintLog log;
    return log;
}

} // namespace

void Environment::NewVariable(Mode mode) {
    switch (mode) {
        case Mode::Constant: ++Log().constants; break;
        case Mode::Public: ++Log().publics; break;
        case Mode::Private: ++Log().privates; break;
    }
}

void Environment::Enforce(bool satisfied, const char* gadget, size_t count) {
    auto& log = Log();
    log.constraints += count;
    if (!satisfied && log.satisfied) {
        log.satisfied = false;
        log.firstViolation = gadget;
        LOG_DEBUG(util::LogCategory::CIRCUIT) << "Constraint violated in " << gadget;
    }
}

size_t Environment::NumConstants() { return Log().constants; }
size_t Environment::NumPublic() { return Log().publics; }
size_t Environment::NumPrivate() { return Log().privates; }
size_t Environment::NumConstraints() { return Log().constraints; }
bool Environment::IsSatisfied() { return Log().satisfied; }
std::string Environment::FirstViolation() { return Log().firstViolation; }

void Environment::Reset() {
    Log() = ConstraintLog{};
}

void Environment::Halt(const std::string& message) {
    LOG_ERROR(util::LogCategory::CIRCUIT) << "Circuit halted: " << message;
    throw CircuitHalt(message);
}

} // namespace circuit
} // namespace veil
