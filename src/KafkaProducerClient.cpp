/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/Exception.hpp"

#include "KafkaProducerClient.hpp"
#include "KafkaUtil.hpp"
#include "Logging.hpp"

#include <vector>

namespace bluesky_kafka {

/* Kept alive until librdkafka reports the delivery of the message,
 * since the payload is not copied by librdkafka. */
struct PendingMessage {
    std::vector<char>          payload;
    std::optional<std::string> key;
    DeliveryCallback           on_delivery;
};

static void dr_msg_cb(rd_kafka_t* rk, const rd_kafka_message_t* rkmessage, void* opaque) {
    (void)opaque;
    if(!rkmessage->_private) return;
    auto msg = static_cast<PendingMessage*>(rkmessage->_private);
    auto _msg = std::unique_ptr<PendingMessage>{msg};
    if(!msg->on_delivery) return;
    std::optional<BrokerError> error;
    if(rkmessage->err) error = makeBrokerError(rkmessage->err);
    MessageMetadata metadata;
    metadata.topic     = topicNameOf(rkmessage);
    metadata.partition = rkmessage->partition;
    metadata.offset    = rkmessage->offset;
    metadata.key       = msg->key;
    try {
        msg->on_delivery(error, metadata);
    } catch(const std::exception& ex) {
        loggerOf(rk)->error(
            "[bluesky_kafka:producer] Delivery callback for topic {} threw an exception: {}",
            metadata.topic, ex.what());
    }
}

KafkaProducerClient::KafkaProducerClient(const Config& config, Logger logger)
: m_logger(std::move(logger)) {
    auto kconf = makeKafkaConf(config, m_logger.get());
    rd_kafka_conf_set_dr_msg_cb(kconf, dr_msg_cb);
    m_kafka_producer = makeKafkaHandle(RD_KAFKA_PRODUCER, kconf);
}

KafkaProducerClient::~KafkaProducerClient() {
    auto rk = m_kafka_producer.get();
    if(rd_kafka_outq_len(rk) > 0) {
        m_logger->debug("[bluesky_kafka:producer] Flushing {} outstanding message(s) before closing",
                        rd_kafka_outq_len(rk));
        rd_kafka_flush(rk, 10000);
    }
    if(rd_kafka_outq_len(rk) > 0) {
        m_logger->warn("[bluesky_kafka:producer] Dropping {} undelivered message(s)",
                       rd_kafka_outq_len(rk));
        rd_kafka_purge(rk, RD_KAFKA_PURGE_F_QUEUE | RD_KAFKA_PURGE_F_INFLIGHT);
        /* serve the delivery reports of the purged messages so they get freed */
        rd_kafka_poll(rk, 0);
    }
}

void KafkaProducerClient::produce(
        const std::string& topic,
        const std::optional<std::string>& key,
        std::vector<char> value,
        DeliveryCallback on_delivery) {

    auto msg = std::make_unique<PendingMessage>();
    msg->payload     = std::move(value);
    msg->key         = key;
    msg->on_delivery = std::move(on_delivery);

    std::vector<rd_kafka_vu_t> args;
    args.reserve(4);

    rd_kafka_vu_t arg;
    arg.vtype      = RD_KAFKA_VTYPE_TOPIC;
    arg.u.cstr     = topic.c_str();
    args.push_back(arg);

    arg.vtype      = RD_KAFKA_VTYPE_VALUE;
    arg.u.mem.ptr  = msg->payload.data();
    arg.u.mem.size = msg->payload.size();
    args.push_back(arg);

    if(msg->key) {
        arg.vtype      = RD_KAFKA_VTYPE_KEY;
        arg.u.mem.ptr  = const_cast<char*>(msg->key->data());
        arg.u.mem.size = msg->key->size();
        args.push_back(arg);
    }

    arg.vtype      = RD_KAFKA_VTYPE_OPAQUE;
    arg.u.ptr      = msg.get();
    args.push_back(arg);

    auto err = rd_kafka_produceva(m_kafka_producer.get(), args.data(), args.size());
    if(err) {
        auto err_str = std::string{rd_kafka_error_string(err)};
        rd_kafka_error_destroy(err);
        throw Exception{"Failed to produce message to topic \"" + topic + "\": " + err_str};
    }
    /* now owned by librdkafka, released in dr_msg_cb */
    msg.release();
}

int KafkaProducerClient::poll(std::chrono::milliseconds timeout) {
    return rd_kafka_poll(m_kafka_producer.get(), toKafkaTimeout(timeout));
}

bool KafkaProducerClient::flush(std::chrono::milliseconds timeout) {
    auto err = rd_kafka_flush(m_kafka_producer.get(), toKafkaTimeout(timeout));
    if(err == RD_KAFKA_RESP_ERR__TIMED_OUT) return false;
    if(err) throw Exception{std::string{"Failed to flush Kafka producer: "} + rd_kafka_err2str(err)};
    return true;
}

ClusterMetadata KafkaProducerClient::clusterMetadata(
        const std::string& topic,
        std::chrono::milliseconds timeout) {

    auto rk = m_kafka_producer.get();

    std::shared_ptr<rd_kafka_topic_t> rkt;
    if(!topic.empty()) {
        auto t = rd_kafka_topic_new(rk, topic.c_str(), nullptr);
        if (!t) throw Exception{std::string{"Failed to create Kafka topic object: "}
                                + rd_kafka_err2str(rd_kafka_last_error())};
        rkt = std::shared_ptr<rd_kafka_topic_t>{t, rd_kafka_topic_destroy};
    }

    const rd_kafka_metadata_t* metadata = nullptr;
    rd_kafka_resp_err_t err = rd_kafka_metadata(
        rk, rkt ? 0 : 1, rkt.get(), &metadata, toKafkaTimeout(timeout));
    if (err) throw Exception{std::string{"Error fetching metadata: "} + rd_kafka_err2str(err)};
    auto _metadata = std::shared_ptr<const rd_kafka_metadata_t>{metadata, rd_kafka_metadata_destroy};

    ClusterMetadata result;
    result.controller_id      = rd_kafka_controllerid(rk, 0);
    result.origin_broker_id   = metadata->orig_broker_id;
    result.origin_broker_name = metadata->orig_broker_name ? metadata->orig_broker_name : "";

    result.brokers.reserve(metadata->broker_cnt);
    for(int i = 0; i < metadata->broker_cnt; ++i) {
        auto& b = metadata->brokers[i];
        result.brokers.push_back(BrokerMetadata{b.id, b.host ? b.host : "", b.port});
    }

    result.topics.reserve(metadata->topic_cnt);
    for(int i = 0; i < metadata->topic_cnt; ++i) {
        auto& t = metadata->topics[i];
        TopicMetadata topic_metadata;
        topic_metadata.name = t.topic;
        if(t.err) topic_metadata.error = makeBrokerError(t.err);
        topic_metadata.partitions.reserve(t.partition_cnt);
        for(int j = 0; j < t.partition_cnt; ++j) {
            auto& p = t.partitions[j];
            PartitionMetadata partition;
            partition.id     = p.id;
            partition.leader = p.leader;
            partition.replicas.assign(p.replicas, p.replicas + p.replica_cnt);
            partition.in_sync_replicas.assign(p.isrs, p.isrs + p.isr_cnt);
            if(p.err) partition.error = makeBrokerError(p.err);
            topic_metadata.partitions.push_back(std::move(partition));
        }
        result.topics.push_back(std::move(topic_metadata));
    }
    return result;
}

std::shared_ptr<ProducerClientInterface> makeKafkaProducerClient(
        const Config& config, Logger logger) {
    return std::make_shared<KafkaProducerClient>(config, std::move(logger));
}

}
