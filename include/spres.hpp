// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "spres_def.hpp"
#include "spres_exception.hpp"
#include "spres_helpers.hpp"
#include "spres_list.hpp"
