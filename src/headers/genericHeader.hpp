#pragma once

#include <string>

#include <pistache/http_headers.h>
#include <pistache/net.h>

// Carries an arbitrary header by name, so caller headers reach the wire as-is
class CGenericHeader : public Pistache::Http::Header::Header {
  public:
    CGenericHeader(const std::string& name, const std::string& value) : m_name(name), m_value(value) {
        ;
    }

    const char* name() const override {
        return m_name.c_str();
    }

    void parse(const std::string& str) override {
        m_value = str;
    }

    void write(std::ostream& os) const override {
        os << m_value;
    }

    std::string value() const {
        return m_value;
    }

  private:
    std::string m_name  = "";
    std::string m_value = "";
};
