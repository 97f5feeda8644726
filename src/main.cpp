#include "Config.hpp"
#include "FileSink.hpp"
#include "LogTransport.hpp"
#include "SinkReader.hpp"
#include <iostream>
#include <string>

namespace
{
    void printUsage(const char *program)
    {
        std::cerr << "Usage: " << program << " <config-file>" << std::endl
                  << "       " << program << " <config-file> --export <destination>" << std::endl;
    }

    int shipStdin(const ShipperConfig &config)
    {
        auto sink = FileSink::fromConfig(config);
        auto transport = LogTransport::create(config, sink);

        size_t lines = 0;
        std::string line;
        while (std::getline(std::cin, line))
        {
            transport->log(LogRecord(line), nullptr);
            ++lines;
        }

        transport->close();
        std::cout << "log_shipper: Shipped " << lines << " lines to "
                  << config.sinkBasePath << "/" << config.logGroupName
                  << " (" << transport->coordinator().droppedEvents() << " dropped)" << std::endl;
        return transport->coordinator().droppedEvents() == 0 ? 0 : 1;
    }

    int exportDestination(const ShipperConfig &config, const std::string &destination)
    {
        auto reader = SinkReader::fromConfig(config);
        size_t exported = reader->exportDestination(config.logGroupName, destination, std::cout);
        return exported > 0 ? 0 : 1;
    }
}

int main(int argc, char **argv)
{
    if (argc != 2 && !(argc == 4 && std::string(argv[2]) == "--export"))
    {
        printUsage(argv[0]);
        return 2;
    }

    try
    {
        ShipperConfig config = loadConfig(argv[1]);
        if (argc == 4)
        {
            return exportDestination(config, argv[3]);
        }
        return shipStdin(config);
    }
    catch (const std::exception &e)
    {
        std::cerr << "log_shipper: " << e.what() << std::endl;
        return 1;
    }
}
