#include <string>
#include <thread>
#include <vector>

#include "../src/core/channel.hpp"

int main() {
    beagle::Channel<std::string> ch;
    std::vector<std::string> got;
    std::thread consumer([&] {
        std::string line;
        while (ch.pop(line)) got.push_back(line);
    });

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&ch, p] {
            for (int i = 0; i < 50; ++i) ch.push(std::to_string(p) + ":" + std::to_string(i));
        });
    }
    for (auto& t : producers) t.join();
    if (!ch.close()) return 1;
    consumer.join();
    if (got.size() != 200) return 2;

    // per-producer order is preserved
    int last[4] = {-1, -1, -1, -1};
    for (const auto& line : got) {
        int p = line[0] - '0';
        int i = std::stoi(line.substr(2));
        if (i <= last[p]) return 3;
        last[p] = i;
    }

    if (ch.push("late")) return 4;
    if (ch.close()) return 5;
    std::string out;
    if (ch.pop(out)) return 6;

    // lines queued before close are still delivered
    beagle::Channel<std::string> ch2;
    ch2.push("a");
    ch2.push("b");
    ch2.close();
    if (!ch2.pop(out) || out != "a") return 7;
    if (!ch2.pop(out) || out != "b") return 8;
    if (ch2.pop(out)) return 9;

    // job hand-off: each pointer popped exactly once across several consumers
    int items[64] = {};
    beagle::Channel<int*> jobs;
    std::vector<std::thread> consumers;
    for (int c = 0; c < 3; ++c) {
        consumers.emplace_back([&jobs] {
            int* item = nullptr;
            while (jobs.pop(item)) ++*item;
        });
    }
    for (auto& item : items) jobs.push(&item);
    jobs.close();
    for (auto& t : consumers) t.join();
    for (int v : items) {
        if (v != 1) return 10;
    }
    return 0;
}
