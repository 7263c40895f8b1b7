/**
 * Fixed-capacity plot window.
 */

#include "test_support.hpp"
#include "../include/ring_buffer.hpp"

static std::vector<float> sample(float a, float b) {
    std::vector<float> v;
    v.push_back(a);
    v.push_back(b);
    return v;
}

bool test_partial_fill() {
    printTestHeader("TEST 1: Fewer samples than capacity");
    RingBuffer ring(2, 4);
    CHECK(ring.size() == 0);
    CHECK(ring.get(0).empty());
    for (int i = 0; i < 3; i++) CHECK(ring.add(sample((float)i, 10.0f * i)));
    std::vector<float> ch0 = ring.get(0);
    std::vector<float> ch1 = ring.get(1);
    CHECK(ring.size() == 3);
    CHECK(ch0.size() == 3);
    CHECK(ch0[0] == 0.0f && ch0[1] == 1.0f && ch0[2] == 2.0f);
    CHECK(ch1[2] == 20.0f);
    return true;
}

bool test_wrap_keeps_latest() {
    printTestHeader("TEST 2: Overflow keeps the last C values in order");
    RingBuffer ring(2, 4);
    for (int i = 0; i < 11; i++) ring.add(sample((float)i, -(float)i));
    CHECK(ring.size() == 4);
    std::vector<float> ch0 = ring.get(0);
    CHECK(ch0.size() == 4);
    for (size_t i = 0; i < 4; i++) CHECK(ch0[i] == (float)(7 + i));
    std::vector<std::vector<float> > all = ring.getAll();
    CHECK(all.size() == 2);
    CHECK(all[1][3] == -10.0f);
    return true;
}

bool test_exact_capacity() {
    printTestHeader("TEST 3: Exactly full");
    RingBuffer ring(1, 3);
    for (int i = 1; i <= 3; i++) ring.add(std::vector<float>(1, (float)i));
    std::vector<float> ch0 = ring.get(0);
    CHECK(ch0.size() == 3);
    CHECK(ch0[0] == 1.0f && ch0[2] == 3.0f);
    return true;
}

bool test_short_sample_rejected() {
    printTestHeader("TEST 4: Short sample is rejected");
    RingBuffer ring(3, 4);
    CHECK(!ring.add(sample(1.0f, 2.0f)));
    CHECK(ring.size() == 0);
    CHECK(ring.get(5).empty());
    return true;
}

bool test_snapshot_is_copy() {
    printTestHeader("TEST 5: get() returns a snapshot");
    RingBuffer ring(1, 2);
    ring.add(std::vector<float>(1, 1.0f));
    std::vector<float> snap = ring.get(0);
    ring.add(std::vector<float>(1, 2.0f));
    ring.add(std::vector<float>(1, 3.0f));
    CHECK(snap.size() == 1 && snap[0] == 1.0f);
    ring.reset();
    CHECK(ring.size() == 0);
    CHECK(ring.dim() == 1);
    CHECK(ring.capacity() == 2);
    return true;
}

bool test_default_capacity() {
    printTestHeader("TEST 6: Default capacity");
    RingBuffer ring(2);
    CHECK(ring.capacity() == RingBuffer::DEFAULT_CAPACITY);
    for (int i = 0; i < 100; i++) ring.add(sample((float)i, 0.0f));
    CHECK(ring.size() == RingBuffer::DEFAULT_CAPACITY);
    CHECK(ring.get(0).back() == 99.0f);
    CHECK(ring.get(0).front() == (float)(100 - RingBuffer::DEFAULT_CAPACITY));
    return true;
}

int main() {
    printTestResult("Partial fill", test_partial_fill());
    printTestResult("Wrap keeps latest", test_wrap_keeps_latest());
    printTestResult("Exact capacity", test_exact_capacity());
    printTestResult("Short sample", test_short_sample_rejected());
    printTestResult("Snapshot", test_snapshot_is_copy());
    printTestResult("Default capacity", test_default_capacity());
    return printSummary();
}
