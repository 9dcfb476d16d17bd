/**
 * @file proto_convert.cpp
 * @brief Wire message conversions.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/core/proto_convert.hpp"

namespace crossmesh {
namespace core {

void toProto(const ServiceInfo& in, discovery::ServiceInfo* out) {
    out->set_name(in.name);
    out->set_namespace_(in.ns);
    out->set_port(in.port);
    out->set_protocol(in.protocol);
}

ServiceInfo fromProto(const discovery::ServiceInfo& in) {
    return ServiceInfo(in.name(), in.namespace_(), static_cast<uint16_t>(in.port()),
                       in.protocol());
}

void toProto(const ClusterInfo& in, discovery::ClusterInfo* out) {
    out->set_cluster_id(in.cluster_id);
    out->set_node_id(in.node_id);
    out->set_relay_url(in.relay_url);
    for (const auto& addr : in.direct_addresses) {
        out->add_direct_addresses(addr);
    }
    for (const auto& service : in.services) {
        toProto(service, out->add_services());
    }
    out->set_services_fingerprint(in.fingerprint());
}

ClusterInfo fromProto(const discovery::ClusterInfo& in) {
    ClusterInfo info;
    info.cluster_id = in.cluster_id();
    info.node_id = in.node_id();
    info.relay_url = in.relay_url();
    info.direct_addresses.assign(in.direct_addresses().begin(), in.direct_addresses().end());
    for (const auto& service : in.services()) {
        info.services.push_back(fromProto(service));
    }
    return info;
}

}  // namespace core
}  // namespace crossmesh
