#pragma once

#include "wellscan/motion/ByteStream.hpp"
#include "wellscan/motion/SerialPort.hpp"

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace testing {

/**
 * In-memory controller: every written line is recorded and answered with the
 * chunks scripted for the first matching command prefix. One-shot replies
 * are consumed in order before the standing reply for that prefix is used.
 */
struct ControllerScript {
    std::mutex m;
    std::condition_variable cv;
    std::deque<std::string> inbound;
    std::vector<std::string> written;
    std::deque<std::pair<std::string, std::vector<std::string>>> once;
    std::map<std::string, std::vector<std::string>> standing;

    void replyOnce(const std::string& prefix, std::vector<std::string> chunks) {
        std::lock_guard<std::mutex> lock(m);
        once.emplace_back(prefix, std::move(chunks));
    }

    void replyAlways(const std::string& prefix, std::vector<std::string> chunks) {
        std::lock_guard<std::mutex> lock(m);
        standing[prefix] = std::move(chunks);
    }

    void push(const std::string& chunk) {
        {
            std::lock_guard<std::mutex> lock(m);
            inbound.push_back(chunk);
        }
        cv.notify_all();
    }

    std::vector<std::string> writtenLines() {
        std::lock_guard<std::mutex> lock(m);
        return written;
    }

    void onWrite(const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(m);
            written.push_back(line);
            const std::string command = line.substr(0, line.find('\n'));
            const std::vector<std::string>* reply = nullptr;
            std::vector<std::string> consumed;
            for (auto it = once.begin(); it != once.end(); ++it) {
                if (command.rfind(it->first, 0) == 0) {
                    consumed = std::move(it->second);
                    once.erase(it);
                    reply = &consumed;
                    break;
                }
            }
            if (!reply) {
                for (const auto& [prefix, chunks] : standing) {
                    if (command.rfind(prefix, 0) == 0) {
                        reply = &chunks;
                        break;
                    }
                }
            }
            if (reply) {
                for (const auto& chunk : *reply) {
                    inbound.push_back(chunk);
                }
            }
        }
        cv.notify_all();
    }
};

class ScriptedStream : public wellscan::motion::ByteStream {
public:
    explicit ScriptedStream(std::shared_ptr<ControllerScript> script)
    : script(std::move(script)) {}

    wellscan::expected<void> write(std::string_view bytes, std::chrono::milliseconds) override {
        if (!open) {
            return wellscan::unexpected(std::make_error_code(std::errc::not_connected));
        }
        script->onWrite(std::string(bytes));
        return {};
    }

    wellscan::expected<std::string> readSome(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(script->m);
        if (!script->cv.wait_for(lock, timeout, [this] { return !script->inbound.empty(); })) {
            return std::string{};
        }
        std::string chunk = std::move(script->inbound.front());
        script->inbound.pop_front();
        return chunk;
    }

    void close() override { open = false; }
    bool isOpen() const override { return open; }

private:
    std::shared_ptr<ControllerScript> script;
    bool open = true;
};

/**
 * Device table for connect(): ports listed in `present` pass the test open and
 * then refuse `failuresBeforeOpen[port]` real opens; anything else reports
 * ENOENT.
 */
struct FakePorts {
    std::shared_ptr<ControllerScript> script = std::make_shared<ControllerScript>();
    std::set<std::string> present;
    std::map<std::string, int> failuresBeforeOpen;
    std::map<std::string, int> openCalls;

    wellscan::motion::StreamFactory factory() {
        return [this](const std::string& device)
                   -> wellscan::expected<std::unique_ptr<wellscan::motion::ByteStream>> {
            ++openCalls[device];
            if (!present.count(device)) {
                return wellscan::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
            }
            const bool firstOpen = openCalls[device] == 1;
            if (!firstOpen && failuresBeforeOpen[device] > 0) {
                --failuresBeforeOpen[device];
                return wellscan::unexpected(std::make_error_code(std::errc::device_or_resource_busy));
            }
            return std::unique_ptr<wellscan::motion::ByteStream>(
                std::make_unique<ScriptedStream>(script));
        };
    }
};

} // namespace testing
