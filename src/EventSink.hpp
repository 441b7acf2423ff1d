#pragma once
#include <string>

// Output side of one streaming connection.
class EventSink {
public:
    virtual ~EventSink() = default;

    // Queues an already framed SSE chunk. false means the connection is gone.
    virtual bool send(const std::string& chunk) = 0;
    virtual void close() = 0;
};
