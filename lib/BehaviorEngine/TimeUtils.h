/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/TimeUtils.h
 *
 * Description:
 * Static utility class for formatting millisecond durations into
 * human-readable strings (e.g., "1h 2min 3s 450ms") for log output.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdio.h>

class TimeUtils {
public:
    /**
     * Formats milliseconds into a human-readable string (e.g., "2min 5s 120ms").
     * Units with 0 values are omitted unless the total time is 0ms.
     * @param totalMillis The duration in milliseconds.
     * @param buffer      The destination buffer.
     * @param size        The size of the buffer.
     */
    static void formatMillis(unsigned long totalMillis, char *buffer, size_t size) {
        if (size == 0) return;

        if (totalMillis == 0) {
            snprintf(buffer, size, "0ms");
            return;
        }

        const unsigned long MS_SEC  = 1000;
        const unsigned long MS_MIN  = 60000;
        const unsigned long MS_HOUR = 3600000;

        unsigned long rem = totalMillis;

        unsigned long h = rem / MS_HOUR;
        rem %= MS_HOUR;

        unsigned long m = rem / MS_MIN;
        rem %= MS_MIN;

        unsigned long s = rem / MS_SEC;
        unsigned long ms = rem % MS_SEC;

        buffer[0] = '\0';
        size_t offset = 0;

        auto append = [&](unsigned long val, const char* suffix) {
            if (val > 0 && offset < size) {
                int written = snprintf(buffer + offset, size - offset, "%lu%s ", val, suffix);
                if (written > 0) offset += (size_t)written;
            }
        };

        append(h, "h");
        append(m, "min");
        append(s, "s");
        append(ms, "ms");

        if (offset > size - 1) offset = size - 1;

        // Trim trailing space
        if (offset > 0 && buffer[offset - 1] == ' ') {
            buffer[offset - 1] = '\0';
        }
    }
};
