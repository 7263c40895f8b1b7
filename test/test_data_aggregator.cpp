/**
 * Running min/mean/max aggregation.
 */

#include "test_support.hpp"
#include "../include/data_aggregator.hpp"

bool test_empty() {
    printTestHeader("TEST 1: Empty aggregator");
    DataAggregator agg(2);
    ResultSet out;
    ChannelResult one;
    std::vector<double> mean;
    CHECK(agg.count() == 0);
    CHECK(!agg.get(out));
    CHECK(out.empty());
    CHECK(!agg.get(0, one));
    CHECK(!agg.getMean(mean));
    return true;
}

bool test_min_mean_max() {
    printTestHeader("TEST 2: Min, mean and max per channel");
    DataAggregator agg(2);
    const float v[][2] = {{4.9f, 10.0f}, {5.1f, 30.0f}, {5.0f, 20.0f}, {5.2f, 40.0f}};
    for (size_t i = 0; i < 4; i++) {
        agg.add(std::vector<float>(v[i], v[i] + 2));
    }
    ResultSet out;
    CHECK(agg.get(out));
    CHECK(out.size() == 2);
    CHECK(agg.count() == 4);
    CHECK(near(out[0].min, 4.9));
    CHECK(near(out[0].mean, 5.05));
    CHECK(near(out[0].max, 5.2));
    CHECK(near(out[1].min, 10.0));
    CHECK(near(out[1].mean, 25.0));
    CHECK(near(out[1].max, 40.0));

    for (size_t i = 0; i < 4; i++) {
        for (size_t c = 0; c < 2; c++) {
            CHECK(out[c].min <= v[i][c] && v[i][c] <= out[c].max);
        }
    }
    return true;
}

bool test_negative_max_is_zero() {
    printTestHeader("TEST 3: Max starts at zero");
    DataAggregator agg(1);
    agg.add(std::vector<float>(1, -3.0f));
    agg.add(std::vector<float>(1, -1.0f));
    ChannelResult r;
    CHECK(agg.get(0, r));
    CHECK(near(r.min, -3.0));
    CHECK(near(r.mean, -2.0));
    CHECK(near(r.max, 0.0));
    return true;
}

bool test_extra_values_ignored() {
    printTestHeader("TEST 4: Values beyond dim are ignored");
    DataAggregator agg(2);
    std::vector<float> values;
    values.push_back(1.0f);
    values.push_back(2.0f);
    values.push_back(99.0f);
    agg.add(values);
    ResultSet out;
    CHECK(agg.get(out));
    CHECK(out.size() == 2);
    CHECK(near(out[1].max, 2.0));
    return true;
}

bool test_reset() {
    printTestHeader("TEST 5: Reset clears the session");
    DataAggregator agg(1);
    agg.add(std::vector<float>(1, 7.0f));
    agg.reset(3);
    CHECK(agg.count() == 0);
    CHECK(agg.dim() == 3);
    ResultSet out;
    CHECK(!agg.get(out));
    agg.add(std::vector<float>(3, 2.0f));
    CHECK(agg.get(out));
    CHECK(out.size() == 3);
    CHECK(near(out[2].mean, 2.0));

    agg.reset();
    CHECK(agg.dim() == 3);
    CHECK(agg.count() == 0);
    return true;
}

bool test_many_samples_mean() {
    printTestHeader("TEST 6: Mean over many samples");
    DataAggregator agg(1);
    double sum = 0.0;
    for (int i = 0; i < 10000; i++) {
        float v = 0.1f * (float)(i % 37);
        sum += v;
        agg.add(std::vector<float>(1, v));
    }
    std::vector<double> mean;
    CHECK(agg.getMean(mean));
    CHECK(near(mean[0], sum / 10000.0, 1e-6));
    return true;
}

int main() {
    printTestResult("Empty aggregator", test_empty());
    printTestResult("Min/mean/max", test_min_mean_max());
    printTestResult("Negative max", test_negative_max_is_zero());
    printTestResult("Extra values", test_extra_values_ignored());
    printTestResult("Reset", test_reset());
    printTestResult("Many samples", test_many_samples_mean());
    return printSummary();
}
