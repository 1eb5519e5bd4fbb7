//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUnsignedOrDefault
// Purpose: Reads an unsigned integer environment variable; returns defaultValue when unset, empty,
//          or not a valid non-negative decimal number.
//==========================================================================================================
inline unsigned long GetEnvUnsignedOrDefault(const char* name, unsigned long defaultValue) {
    const std::string raw = GetEnvOrDefault(name, std::string());
    if (raw.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    const unsigned long v = std::strtoul(raw.c_str(), &end, 10);
    if (end == raw.c_str() || *end != '\0' || raw[0] == '-') {
        return defaultValue;
    }
    return v;
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Interprets "1", "true", "TRUE", "yes", "on" as true; "0", "false", "FALSE", "no", "off" as false;
//          anything else (including unset) yields defaultValue.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "FALSE" || v == "no" || v == "off") {
        return false;
    }
    return defaultValue;
}
