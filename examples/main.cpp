#include "LogTransport.hpp"
#include "FileSink.hpp"
#include "SinkReader.hpp"
#include <iostream>
#include <filesystem>
#include <thread>
#include <vector>

int main()
{
    // system parameters
    ShipperConfig config;
    config.logGroupName = "example-group";
    config.streamNamePrefix = "app";
    config.flushInterval = std::chrono::milliseconds(200);
    config.sinkBasePath = "./shipped";
    config.compressionLevel = 4;
    config.maxSegmentSize = 1 * 1024 * 1024; // 1 MB
    config.maxOpenFiles = 8;

    if (std::filesystem::exists(config.sinkBasePath))
    {
        std::filesystem::remove_all(config.sinkBasePath);
    }

    auto sink = FileSink::fromConfig(config);
    auto transport = LogTransport::create(config, sink);

    // plain rendered line
    transport->log("service started", [] {});

    // structured record with a message field only
    LogRecord request;
    request.message = "GET /users/42 200";
    request.fields["latency_ms"] = "12";
    transport->log(request, [] {});

    // concurrent producers never wait on the sink
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t)
    {
        producers.emplace_back([&transport, t]()
                               {
            for (int i = 0; i < 1000; ++i)
            {
                transport->log("worker " + std::to_string(t) + " event " + std::to_string(i), nullptr);
            } });
    }
    for (auto &producer : producers)
    {
        producer.join();
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    transport->close();

    SinkReader reader(config.sinkBasePath, config.useEncryption, config.compressionLevel);
    for (const auto &destination : reader.listDestinations(config.logGroupName))
    {
        auto events = reader.readDestination(config.logGroupName, destination);
        std::cout << destination << ": " << events.size() << " events" << std::endl;
    }

    return 0;
}
