#include "core/types/ProbeObservation.hpp"

namespace lanwatch::core {

const std::unordered_map<uint16_t, std::string>& ServiceCatalog::knownServices() {
    static const std::unordered_map<uint16_t, std::string> services = {
        {21, "ftp"},        {22, "ssh"},          {23, "telnet"},     {25, "smtp"},
        {53, "domain"},     {80, "http"},         {110, "pop3"},      {139, "netbios-ssn"},
        {143, "imap"},      {443, "https"},       {445, "microsoft-ds"}, {515, "printer"},
        {548, "afp"},       {554, "rtsp"},        {631, "ipp"},       {993, "imaps"},
        {995, "pop3s"},     {1883, "mqtt"},       {2049, "nfs"},      {3389, "ms-wbt-server"},
        {5000, "upnp"},     {5353, "mdns"},       {8008, "http"},     {8080, "http-proxy"},
        {8443, "https-alt"}, {9000, "cslistener"}, {9100, "jetdirect"}};
    return services;
}

std::string ServiceCatalog::serviceForPort(uint16_t port) {
    const auto& services = knownServices();
    auto it = services.find(port);
    return it != services.end() ? it->second : "";
}

const std::vector<uint16_t>& ServiceCatalog::signaturePorts() {
    static const std::vector<uint16_t> ports = {21,  22,  23,  25,   53,   80,   110,  139,
                                                443, 445, 515, 548,  554,  631,  2049, 3389,
                                                5000, 8080, 8443, 9000, 9100};
    return ports;
}

} // namespace lanwatch::core
