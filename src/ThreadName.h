/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#if defined(__APPLE__) || defined(__linux__)
#include <pthread.h>
#endif
#include <string>

namespace flowvisor::thread {

// thread names are limited to 15 characters on linux
static inline void change_self_name(const std::string &schema, const std::string &unique_name)
{
    auto name = schema.substr(0, 1) + "-" + unique_name;
#if defined(__APPLE__)
    pthread_setname_np(name.substr(0, 15).c_str());
#elif defined(__linux__)
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#endif
}

}
