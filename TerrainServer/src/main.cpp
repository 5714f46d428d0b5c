/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file main.cpp
 * @brief Command line entry point for decoding, querying and serving DTED files
 */

#include <iostream>
#include <iomanip>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "DtedError.hpp"
#include "DtedJson.hpp"
#include "DtedReader.hpp"
#include "Logger.hpp"
#include "ServerConfig.hpp"
#include "TerrainServerDTED.hpp"

/**
 * @brief Print usage
 */
static void printUsage(const char* program)
{
    std::cerr << "Usage:\n"
              << "  " << program << " info <file.dtN> [--full]\n"
              << "  " << program << " query <file.dtN> <lat> <lon>\n"
              << "  " << program << " grid <file.dtN> <latStart> <lonStart> <latEnd> <lonEnd> <nLat> <nLon> <out.csv>\n"
              << "  " << program << " serve <config.json> [--port N]\n"
              << "Options:\n"
              << "  --config <file.json>       load settings from a JSON file\n"
              << "  --checksum <ignore|warn|reject>\n"
              << "  --log-level <debug|info|warn|error>\n"
              << "  --port <N>                 TCP port for serve\n"
              << "  --verify-sentinels         require DSIU/ACC block sentinels\n"
              << "  --void-as-missing          treat void posts as missing data\n";
}

/**
 * @brief Split options out of argv, leaving positional arguments
 * @return Positional arguments
 */
static std::vector<std::string> parseArguments(int argc, char* argv[], ServerConfig& config, bool& full)
{
    std::vector<std::string> positional;
    std::vector<std::string> args(argv + 1, argv + argc);

    // Config files are read first so flags can override them
    if (args.size() >= 2 && args[0] == "serve" && args[1].compare(0, 2, "--") != 0)
    {
        config = loadServerConfig(args[1]);
    }
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == "--config")
        {
            config = loadServerConfig(args[i + 1]);
        }
    }

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size())
            {
                throw std::invalid_argument("missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--config")
        {
            next();
        }
        else if (arg == "--checksum")
        {
            config.decode.checksumPolicy = parseChecksumPolicy(next());
        }
        else if (arg == "--log-level")
        {
            config.logLevel = parseLogLevel(next());
        }
        else if (arg == "--port")
        {
            config.port = parsePort(next());
        }
        else if (arg == "--verify-sentinels")
        {
            config.decode.verifySectionSentinels = true;
        }
        else if (arg == "--void-as-missing")
        {
            config.voidAsMissing = true;
        }
        else if (arg == "--full")
        {
            full = true;
        }
        else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
        {
            throw std::invalid_argument("unknown option " + arg);
        }
        else
        {
            positional.push_back(arg);
        }
    }
    return positional;
}

/**
 * @brief Main function
 */
int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        printUsage(argv[0]);
        return 2;
    }

    try
    {
        ServerConfig config;
        bool full = false;
        std::vector<std::string> args = parseArguments(argc, argv, config, full);
        if (args.empty())
        {
            printUsage(argv[0]);
            return 2;
        }

        const std::string command = args[0];

        if (command == "serve")
        {
            applyLogging(config);
            if (config.dtedFile.empty())
            {
                logger.error("No dted_file configured");
                return 2;
            }

            TerrainServerDTED server(config.dtedFile, config.decode, config.voidAsMissing);
            server.startServer(config.port);
            return 1;
        }

        applyLogging(config);

        if (command == "info" && args.size() == 2)
        {
            if (full)
            {
                ElevationGrid grid = ElevationGrid::load(args[1], config.decode, config.voidAsMissing);
                std::cout << gridToJson(grid).dump(2) << std::endl;
            }
            else
            {
                std::cout << headerToJson(readDtedHeader(args[1])).dump(2) << std::endl;
            }
            return 0;
        }

        if (command == "query" && args.size() == 4)
        {
            TerrainServerDTED server(args[1], config.decode, config.voidAsMissing);
            std::optional<double> elevation = server.getElevation(std::stod(args[2]), std::stod(args[3]));
            if (elevation)
            {
                std::cout << std::fixed << std::setprecision(3) << *elevation << std::endl;
            }
            else
            {
                std::cout << "none" << std::endl;
            }
            return 0;
        }

        if (command == "grid" && args.size() == 9)
        {
            TerrainServerDTED server(args[1], config.decode, config.voidAsMissing);
            std::vector<TerrainPoint> terrain = server.getElevationGrid(
                std::stod(args[2]), std::stod(args[3]), std::stod(args[4]), std::stod(args[5]),
                std::stoi(args[6]), std::stoi(args[7]));

            std::cout << "Retrieved " << terrain.size() << " terrain points" << std::endl;
            return server.exportToCSV(terrain, args[8]) ? 0 : 1;
        }

        printUsage(argv[0]);
        return 2;
    }
    catch (const DtedError& e)
    {
        logger.error(e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        logger.error(e.what());
        return 1;
    }
}
