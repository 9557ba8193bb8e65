#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <httplib.h>

extern std::string kHost;
extern int kPort;
extern int kMaxParallel;

// Registers the API routes, CORS headers and the request logger.
void SetupRoutes(httplib::Server& server);

// Serves on kHost:kPort with kMaxParallel workers until the server stops.
// Returns false if the address cannot be bound.
bool ServerWorkLoop();

#endif  // SERVER_IO_H_
