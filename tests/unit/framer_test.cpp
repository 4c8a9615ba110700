/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include "sotto/protocol.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace sotto;

static void feed(LineFramer& framer, const std::string& data) {
    framer.append(data.data(), data.size());
}

static void testSplitFrame() {
    LineFramer framer;
    feed(framer, "{\"command\":");
    assert(!framer.next());
    feed(framer, "\"status\"}");
    assert(!framer.next());
    feed(framer, "\n");
    auto frame = framer.next();
    assert(frame && *frame == "{\"command\":\"status\"}");
    assert(!framer.next());
    assert(framer.buffered() == 0);
}

static void testSeveralFramesInOneRead() {
    LineFramer framer;
    feed(framer, "a\nb\r\n\n   \nc\n");
    assert(*framer.next() == "a");
    assert(*framer.next() == "b");
    assert(*framer.next() == "c");
    assert(!framer.next());
}

static void testFlushOnEof() {
    LineFramer framer;
    feed(framer, "first\nunterminated");
    assert(*framer.next() == "first");
    assert(!framer.next());
    auto rest = framer.flush();
    assert(rest && *rest == "unterminated");
    assert(!framer.flush());
}

static void testOverflowWithoutDelimiter() {
    LineFramer framer(16);
    feed(framer, std::string(10, 'x'));
    assert(!framer.next());
    assert(!framer.overflowed());
    feed(framer, std::string(10, 'x'));
    assert(!framer.next());
    assert(framer.overflowed());
}

static void testOverflowWithDelimiter() {
    LineFramer framer(8);
    feed(framer, std::string(20, 'y') + "\nok\n");
    assert(!framer.next());
    assert(framer.overflowed());
}

static void testLongStream() {
    // Consumed bytes are compacted away as frames are read
    LineFramer framer(64);
    for (int i = 0; i < 1000; ++i) {
        feed(framer, "frame-" + std::to_string(i) + "\n");
        auto frame = framer.next();
        assert(frame && *frame == "frame-" + std::to_string(i));
    }
    assert(!framer.overflowed());
}

int main() {
    testSplitFrame();
    testSeveralFramesInOneRead();
    testFlushOnEof();
    testOverflowWithoutDelimiter();
    testOverflowWithDelimiter();
    testLongStream();
    std::cout << "framer_test: all tests passed\n";
    return 0;
}
