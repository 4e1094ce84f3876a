// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cdio/cdio.h>
#include <cdio/device.h>

#include <cstdlib>
#include <string>

#include "internal.h"

using namespace discrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static const std::string fallback_device = "/dev/sr0";

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* discrip_default_device() {
    std::string device;
    char* detected = cdio_get_default_device(nullptr);
    if (detected) {
        device = detected;
        std::free(detected);
    }
    if (device.empty()) device = fallback_device;
    return make_mutable_cstr_copy(device);
}

};
