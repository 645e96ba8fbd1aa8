#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "relaychat/tslog.hpp"

using namespace tslog;

// Each worker plays a session thread logging its traffic.
void session_fn(int idx, int messages) {
    for (int i = 0; i < messages; ++i) {
        Logger::instance().info("session " + std::to_string(idx) + " relayed message " + std::to_string(i));
        if (i % 10 == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

int main(int argc, char** argv) {
    const int nthreads = (argc > 1) ? std::stoi(argv[1]) : 8;
    const int msgs = (argc > 2) ? std::stoi(argv[2]) : 200;
    const std::string path = "tslog_cli_test.log";

    std::remove(path.c_str());
    Logger::instance().init(path, Level::DEBUG);

    std::vector<std::thread> workers;
    for (int i = 0; i < nthreads; ++i) {
        workers.emplace_back(session_fn, i, msgs);
    }
    for (auto& t : workers) t.join();

    Logger::instance().shutdown();

    std::ifstream in(path);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        if (line.find("[INFO ]") == std::string::npos) {
            std::cerr << "malformed line: " << line << std::endl;
            return 1;
        }
        ++count;
    }
    std::remove(path.c_str());

    const int expected = nthreads * msgs;
    std::cout << count << " of " << expected << " lines written" << std::endl;
    return count == expected ? 0 : 1;
}
