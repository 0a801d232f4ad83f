// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "profile.hpp"
#include "spres_def.hpp"

#include <string>

namespace stackprof {

// Encodes the profile in the pprof format and writes it to fd
SPRes pprof_write_profile(const Profile &profile, int fd);

// Creates (or truncates) path and writes the encoded profile to it
SPRes pprof_write_profile_file(const Profile &profile, const std::string &path);

} // namespace stackprof
