#pragma once

#include <cstdint>
#include <string>

namespace notify
{
enum class kind : uint8_t
{
    OK,
    INFO,
    ERROR,
};

class sink
{
  public:
    virtual ~sink() = default;

    // Best effort, never throws.
    virtual void send(kind kind, const std::string &body) = 0;
};

class desktop_sink : public sink
{
  public:
    void send(kind kind, const std::string &body) override;
};

class null_sink : public sink
{
  public:
    void send(kind, const std::string &) override
    {
    }
};

} // namespace notify
