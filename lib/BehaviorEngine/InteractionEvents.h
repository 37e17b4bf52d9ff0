/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/InteractionEvents.h
 *
 * Description:
 * Convenience constructors for InteractionEvent. Collaborators feeding the
 * engine from native code use these instead of filling the struct by hand.
 * =================================================================================
 */
#pragma once
#include <stdio.h>
#include <string.h>
#include "Types.h"

class InteractionEvents {
public:
    static InteractionEvent make(EventKind kind, uint32_t timestamp) {
        InteractionEvent e;
        memset(&e, 0, sizeof(e));
        e.kind = kind;
        e.timestamp = timestamp;
        e.visible = true;
        return e;
    }

    static InteractionEvent pointerMove(float x, float y, uint32_t timestamp) {
        InteractionEvent e = make(EVT_POINTER_MOVE, timestamp);
        e.hasPosition = true;
        e.x = x;
        e.y = y;
        return e;
    }

    static InteractionEvent pointerDown(float x, float y, uint32_t timestamp) {
        InteractionEvent e = pointerMove(x, y, timestamp);
        e.kind = EVT_POINTER_DOWN;
        return e;
    }

    static InteractionEvent click(uint32_t timestamp) { return make(EVT_CLICK, timestamp); }

    static InteractionEvent touch(EventKind kind, float x, float y, uint8_t contacts, uint32_t timestamp) {
        InteractionEvent e = make(kind, timestamp);
        e.contacts = contacts;
        if (contacts > 0) {
            e.hasPosition = true;
            e.x = x;
            e.y = y;
        }
        return e;
    }

    static InteractionEvent keyDown(uint32_t timestamp) { return make(EVT_KEY_DOWN, timestamp); }
    static InteractionEvent keyUp(uint32_t timestamp) { return make(EVT_KEY_UP, timestamp); }

    static InteractionEvent focus(const char* field, uint32_t timestamp) {
        InteractionEvent e = make(EVT_FOCUS, timestamp);
        setField(e, field);
        return e;
    }

    static InteractionEvent blur(const char* field, uint32_t timestamp) {
        InteractionEvent e = make(EVT_BLUR, timestamp);
        setField(e, field);
        return e;
    }

    static InteractionEvent visibility(bool visible, uint32_t timestamp) {
        InteractionEvent e = make(EVT_VISIBILITY_CHANGE, timestamp);
        e.visible = visible;
        return e;
    }

    static InteractionEvent paste(const char* field, uint32_t length, uint32_t timestamp) {
        InteractionEvent e = make(EVT_PASTE, timestamp);
        setField(e, field);
        e.length = length;
        return e;
    }

    static InteractionEvent fieldInput(const char* field, uint32_t length, uint32_t timestamp) {
        InteractionEvent e = make(EVT_FIELD_INPUT, timestamp);
        setField(e, field);
        e.length = length;
        return e;
    }

    static void setField(InteractionEvent& e, const char* field) {
        snprintf(e.field, sizeof(e.field), "%s", field ? field : "");
    }
};
