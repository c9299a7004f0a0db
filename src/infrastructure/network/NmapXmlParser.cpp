#include "infrastructure/network/NmapXmlParser.hpp"

#include "core/types/MacAddress.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <optional>

namespace lanwatch::infra {

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

bool isElement(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

std::optional<std::string> attribute(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

const xmlNode* firstChild(const xmlNode* node, const char* name) {
    for (const xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (isElement(child, name)) {
            return child;
        }
    }
    return nullptr;
}

std::optional<double> parseNumber(const std::optional<std::string>& text) {
    if (!text || text->empty()) {
        return std::nullopt;
    }
    try {
        return std::stod(*text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void readAddresses(const xmlNode* host, core::ProbeObservation& observation) {
    for (const xmlNode* child = host->children; child != nullptr; child = child->next) {
        if (!isElement(child, "address")) {
            continue;
        }

        auto type = attribute(child, "addrtype").value_or("");
        auto addr = attribute(child, "addr");
        if (!addr) {
            continue;
        }

        if (type == "ipv4") {
            observation.address = *addr;
        } else if (type == "mac") {
            observation.macAddress = core::MacAddress::normalize(*addr).value_or(*addr);
            if (auto vendor = attribute(child, "vendor"); vendor && !vendor->empty()) {
                observation.vendor = *vendor;
            }
        }
    }
}

void readPorts(const xmlNode* host, core::ProbeObservation& observation) {
    const xmlNode* ports = firstChild(host, "ports");
    if (ports == nullptr) {
        return;
    }

    for (const xmlNode* port = ports->children; port != nullptr; port = port->next) {
        if (!isElement(port, "port")) {
            continue;
        }

        const xmlNode* state = firstChild(port, "state");
        if (state == nullptr || attribute(state, "state").value_or("") != "open") {
            continue;
        }

        auto portId = parseNumber(attribute(port, "portid"));
        if (!portId || *portId < 1 || *portId > 65535) {
            continue;
        }

        core::ServiceInfo service;
        service.port = static_cast<uint16_t>(*portId);
        service.protocol = attribute(port, "protocol").value_or("tcp");

        if (const xmlNode* svc = firstChild(port, "service")) {
            service.name = attribute(svc, "name").value_or("");
            std::string product = attribute(svc, "product").value_or("");
            std::string version = attribute(svc, "version").value_or("");
            service.version = product;
            if (!version.empty()) {
                service.version += product.empty() ? version : " " + version;
            }
        }
        if (service.name.empty()) {
            service.name = core::ServiceCatalog::serviceForPort(service.port);
        }

        observation.openPorts.push_back(service.port);
        observation.services.push_back(std::move(service));
    }

    std::sort(observation.openPorts.begin(), observation.openPorts.end());
    observation.openPorts.erase(
        std::unique(observation.openPorts.begin(), observation.openPorts.end()),
        observation.openPorts.end());
}

std::optional<core::ProbeObservation> readHost(const xmlNode* host) {
    const xmlNode* status = firstChild(host, "status");
    if (status == nullptr || attribute(status, "state").value_or("") != "up") {
        return std::nullopt;
    }

    core::ProbeObservation observation;
    observation.isAlive = true;
    readAddresses(host, observation);
    if (observation.address.empty()) {
        return std::nullopt;
    }

    if (const xmlNode* hostnames = firstChild(host, "hostnames")) {
        if (const xmlNode* hostname = firstChild(hostnames, "hostname")) {
            auto name = attribute(hostname, "name");
            if (name && !name->empty()) {
                observation.hostname = *name;
            }
        }
    }

    // srtt is reported in microseconds
    if (const xmlNode* times = firstChild(host, "times")) {
        if (auto srtt = parseNumber(attribute(times, "srtt"))) {
            observation.latencyMs = *srtt / 1000.0;
        }
    }

    readPorts(host, observation);

    if (const xmlNode* os = firstChild(host, "os")) {
        if (const xmlNode* match = firstChild(os, "osmatch")) {
            observation.osHint = attribute(match, "name");
        }
    }

    return observation;
}

} // namespace

std::vector<core::ProbeObservation> NmapXmlParser::parse(const std::string& xml) {
    std::vector<core::ProbeObservation> observations;
    if (xml.empty()) {
        spdlog::error("nmap produced an empty report");
        return observations;
    }

    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "nmap.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                  &xmlFreeDoc);
    if (!doc) {
        spdlog::error("Failed to parse nmap XML report ({} bytes)", xml.size());
        return observations;
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (root == nullptr || !isElement(root, "nmaprun")) {
        spdlog::error("nmap XML report has no nmaprun element");
        return observations;
    }

    for (const xmlNode* node = root->children; node != nullptr; node = node->next) {
        if (!isElement(node, "host")) {
            continue;
        }
        if (auto observation = readHost(node)) {
            observations.push_back(std::move(*observation));
        }
    }

    spdlog::debug("Parsed {} live hosts from nmap report", observations.size());
    return observations;
}

} // namespace lanwatch::infra
