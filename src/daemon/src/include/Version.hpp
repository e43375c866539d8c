/*
 * MicrogridControl — Version
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

// The build passes -DMGCD_VERSION from the CMake project version.
#ifndef MGCD_VERSION
#define MGCD_VERSION "0.1.0"
#endif
