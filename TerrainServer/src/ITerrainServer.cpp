/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file ITerrainServer.cpp
 * @brief ITerrainServer class implementation
 */

#include "ITerrainServer.hpp"
#include "Logger.hpp"
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <thread>
#include <cstring>

/**
 * @brief Starts the terrain server to listen for client requests
 * @details Blocks serving clients; returns only when the socket cannot be set up.
 * @param port Port number to listen on
 */
void ITerrainServer::startServer(int port)
{
    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0)
    {
        logger.error("Socket creation failed: " + std::string(std::strerror(errno)));
        return;
    }

    // Set socket options to reuse address
    int opt = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)))
    {
        logger.warn("Failed to set SO_REUSEADDR");
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port);

    if (bind(server_fd, (struct sockaddr*)&address, sizeof(address)) < 0)
    {
        logger.error("Socket bind failed on port " + std::to_string(port) + ": " +
                     std::string(std::strerror(errno)));
        close(server_fd);
        return;
    }

    if (listen(server_fd, 3) < 0)
    {
        logger.error("Socket listen failed: " + std::string(std::strerror(errno)));
        close(server_fd);
        return;
    }

    logger.info("TerrainServer listening on port " + std::to_string(port));

    while (true)
    {
        int clientSocket = accept(server_fd, nullptr, nullptr);
        if (clientSocket < 0)
        {
            logger.error("Socket accept failed: " + std::string(std::strerror(errno)));
            continue;
        }

        // Handle client in a separate thread
        std::thread([this, clientSocket]() {
            handleClient(clientSocket);
        }).detach();
    }

    close(server_fd);
}

/**
 * @brief Handles a client connection
 * @param clientSocket Socket descriptor for the client
 */
void ITerrainServer::handleClient(int clientSocket)
{
    char buffer[1024] = {0};
    ssize_t bytes_read = read(clientSocket, buffer, sizeof(buffer) - 1);
    
    if (bytes_read <= 0)
    {
        close(clientSocket);
        return;
    }

    std::string response = formatElevationResponse(std::string(buffer, bytes_read));
    if (send(clientSocket, response.c_str(), response.size(), 0) < 0)
    {
        logger.warn("Failed to send response: " + std::string(std::strerror(errno)));
    }

    close(clientSocket);
}

/**
 * @brief Answer one "<lat>,<lon>" request
 * @param request Request text
 * @return "Elevation: <meters>\n", "Elevation: none\n" outside coverage, or a usage message
 */
std::string ITerrainServer::formatElevationResponse(const std::string& request) const
{
    double lat, lon;
    char trailing;
    if (sscanf(request.c_str(), "%lf,%lf %c", &lat, &lon, &trailing) != 2)
    {
        logger.warn("Invalid request: " + request);
        return "Invalid request format. Use: <lat>,<lon>\n";
    }

    logger.debug("Received request for elevation at (" + 
                 std::to_string(lat) + ", " + std::to_string(lon) + ")");

    std::optional<double> elev = getElevation(lat, lon);
    if (!elev)
    {
        return "Elevation: none\n";
    }

    std::ostringstream oss;
    oss << "Elevation: " << std::fixed << std::setprecision(3) << *elev << "\n";
    return oss.str();
}

/**
 * @brief Exports terrain points to a CSV file
 * @param points Vector of TerrainPoint to export
 * @param filename Output CSV filename
 * @return true if the file was written
 */
bool ITerrainServer::exportToCSV(const std::vector<TerrainPoint>& points, const std::string& filename) const
{
    std::ofstream file(filename);
    if (!file)
    {
        logger.error("Cannot open CSV for writing: " + filename);
        return false;
    }

    file << "latitude,longitude,elevation\n";

    for (const auto& pt: points)
    {
        file << std::fixed << std::setprecision(6)
             << pt.lat << "," << pt.lon << "," << pt.alt << "\n";
    }

    logger.info("Exported " + std::to_string(points.size()) + " points to CSV: " + filename);
    return static_cast<bool>(file);
}

/**
 * @brief Checks if a point is within the bounding box
 * @param lat Latitude of the point
 * @param lon Longitude of the point
 */
bool ITerrainServer::isPointInBounds(double lat, double lon) const
{
    return (lat >= bbox_.min_lat && lat <= bbox_.max_lat &&
            lon >= bbox_.min_lon && lon <= bbox_.max_lon);
}
