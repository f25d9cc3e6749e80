/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_CLUSTER_METADATA_HPP
#define BLUESKY_KAFKA_CLUSTER_METADATA_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/Message.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bluesky_kafka {

struct BrokerMetadata {
    int32_t     id = -1;
    std::string host;
    int         port = 0;
};

struct PartitionMetadata {
    int32_t                    id = -1;
    int32_t                    leader = -1;
    std::vector<int32_t>       replicas;
    std::vector<int32_t>       in_sync_replicas;
    std::optional<BrokerError> error;
};

struct TopicMetadata {
    std::string                    name;
    std::vector<PartitionMetadata> partitions;
    std::optional<BrokerError>     error;
};

/**
 * @brief Snapshot of the brokers of a cluster and of the
 * topics requested from it.
 */
struct ClusterMetadata {
    int32_t                     controller_id = -1;
    int32_t                     origin_broker_id = -1;
    std::string                 origin_broker_name;
    std::vector<BrokerMetadata> brokers;
    std::vector<TopicMetadata>  topics;

    /**
     * @brief Returns the metadata of the topic with the given
     * name, or nullptr if the topic is not part of the snapshot.
     */
    const TopicMetadata* topic(const std::string& name) const {
        for(auto& t : topics) {
            if(t.name == name) return &t;
        }
        return nullptr;
    }
};

}

#endif
