#pragma once

#include <expected>
#include <string>

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual std::expected<void, std::string> notify(const std::string& summary,
                                                    const std::string& body) = 0;
};
