/**
 * Copyright (C) 2025, Bruce MacKinnon KC1FSZ
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#include <stdio.h>
#include <errno.h>
#include <string.h>

#include <pthread.h>

#include "ThreadUtil.h"

namespace kc1fsz {
    namespace gwbridge {

// Linux limit, including the null
static const unsigned MAX_NAME_LEN = 16;

void setThreadName(const char* name) {
    char buf[MAX_NAME_LEN];
    strncpy(buf, name, MAX_NAME_LEN - 1);
    buf[MAX_NAME_LEN - 1] = 0;
    pthread_setname_np(pthread_self(), buf);
}

void getThreadName(char* buf, unsigned bufLen) {
    if (bufLen == 0)
        return;
    buf[0] = 0;
    char tmp[MAX_NAME_LEN];
    if (pthread_getname_np(pthread_self(), tmp, sizeof(tmp)) == 0) {
        strncpy(buf, tmp, bufLen - 1);
        buf[bufLen - 1] = 0;
    }
}

void lowerThreadPriority() {
    const pthread_t self = pthread_self();
    int policy;
    struct sched_param param;

    if (pthread_getschedparam(self, &policy, &param) != 0) {
        perror("pthread_getschedparam failed");
        return;
    }
    if (policy != SCHED_OTHER) {
        // Priority must be 0 for SCHED_OTHER
        param.sched_priority = 0;
        if (pthread_setschedparam(self, SCHED_OTHER, &param) != 0) {
            perror("pthread_setschedparam to SCHED_OTHER failed");
            if (errno == EPERM)
                printf("Permission denied. CAP_SYS_NICE is needed to leave a real-time policy.\n");
        }
    }
}

    }
}
