// VEIL - Values
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/program/value.h"

namespace veil {

std::vector<Field> Value::ToFields() const {
    return std::visit([](const auto& v) { return v.ToFields(); }, value_);
}

} // namespace veil
