#pragma once

#include <string>

class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    // True only if the service positively reports itself healthy.
    virtual bool healthy() = 0;
};

// GETs the local health endpoint and checks that its JSON "status" is "healthy".
class HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe(std::string url, long timeout_seconds);
    bool healthy() override;

private:
    std::string url_;
    long timeout_seconds_;
};
