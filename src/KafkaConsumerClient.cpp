/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "bluesky_kafka/Exception.hpp"

#include "KafkaConsumerClient.hpp"
#include "KafkaUtil.hpp"
#include "Logging.hpp"

#include <cstring>

namespace bluesky_kafka {

static void rebalance_cb(rd_kafka_t* kcons,
                         rd_kafka_resp_err_t err,
                         rd_kafka_topic_partition_list_t* list,
                         void* opaque) {
    (void)opaque;
    auto logger = loggerOf(kcons);
    const bool cooperative = std::strcmp(rd_kafka_rebalance_protocol(kcons), "COOPERATIVE") == 0;
    if (err == RD_KAFKA_RESP_ERR__ASSIGN_PARTITIONS) {
        for(int i = 0; i < list->cnt; ++i) {
            logger->debug("[bluesky_kafka:consumer] Assigned partition {} of topic {}",
                          list->elems[i].partition, list->elems[i].topic);
        }
        if(cooperative) {
            auto error = rd_kafka_incremental_assign(kcons, list);
            if(error) {
                logger->error("[bluesky_kafka:consumer] rd_kafka_incremental_assign failed: {}",
                              rd_kafka_error_string(error));
                rd_kafka_error_destroy(error);
            }
        } else {
            auto error = rd_kafka_assign(kcons, list);
            if(error) {
                logger->error("[bluesky_kafka:consumer] rd_kafka_assign failed: {}",
                              rd_kafka_err2str(error));
            }
        }
    } else {
        if(err != RD_KAFKA_RESP_ERR__REVOKE_PARTITIONS) {
            logger->error("[bluesky_kafka:consumer] Rebalance failed: {}", rd_kafka_err2str(err));
        }
        if(cooperative) {
            auto error = rd_kafka_incremental_unassign(kcons, list);
            if(error) {
                logger->error("[bluesky_kafka:consumer] rd_kafka_incremental_unassign failed: {}",
                              rd_kafka_error_string(error));
                rd_kafka_error_destroy(error);
            }
        } else {
            auto error = rd_kafka_assign(kcons, nullptr);
            if(error) {
                logger->error("[bluesky_kafka:consumer] rd_kafka_assign failed: {}",
                              rd_kafka_err2str(error));
            }
        }
    }
}

KafkaConsumerClient::KafkaConsumerClient(const Config& config, Logger logger)
: m_logger(std::move(logger)) {
    auto kconf = makeKafkaConf(config, m_logger.get());
    rd_kafka_conf_set_rebalance_cb(kconf, rebalance_cb);
    m_kafka_consumer = makeKafkaHandle(RD_KAFKA_CONSUMER, kconf);
    /* serve all events (logs, rebalances, errors) from rd_kafka_consumer_poll */
    rd_kafka_poll_set_consumer(m_kafka_consumer.get());
}

KafkaConsumerClient::~KafkaConsumerClient() {
    if(m_closed) return;
    try {
        close();
    } catch(const Exception& ex) {
        m_logger->error("[bluesky_kafka:consumer] {}", ex.what());
    }
}

void KafkaConsumerClient::subscribe(const std::vector<std::string>& topics) {
    auto subscription = rd_kafka_topic_partition_list_new(static_cast<int>(topics.size()));
    auto subscription_ptr = std::shared_ptr<rd_kafka_topic_partition_list_t>{
        subscription, rd_kafka_topic_partition_list_destroy};
    for(auto& topic : topics) {
        rd_kafka_topic_partition_list_add(subscription, topic.c_str(), RD_KAFKA_PARTITION_UA);
    }
    auto err = rd_kafka_subscribe(m_kafka_consumer.get(), subscription);
    if (err) throw Exception{"Failed to subscribe to topic(s): " + std::string{rd_kafka_err2str(err)}};
}

std::optional<Message> KafkaConsumerClient::poll(std::chrono::milliseconds timeout) {
    rd_kafka_message_t* msg = rd_kafka_consumer_poll(
        m_kafka_consumer.get(), toKafkaTimeout(timeout));
    if(!msg) return std::nullopt;
    auto _msg = std::unique_ptr<rd_kafka_message_t, decltype(&rd_kafka_message_destroy)>{
        msg, rd_kafka_message_destroy};

    Message result;
    result.topic     = topicNameOf(msg);
    result.partition = msg->partition;
    result.offset    = msg->offset;
    if(msg->err) {
        result.error = BrokerError{static_cast<int>(msg->err), rd_kafka_message_errstr(msg)};
        return result;
    }
    result.key = keyOf(msg);
    if(msg->payload && msg->len) {
        auto payload = static_cast<const char*>(msg->payload);
        result.value.assign(payload, payload + msg->len);
    }
    return result;
}

void KafkaConsumerClient::close() {
    if(m_closed) return;
    m_closed = true;
    auto err = rd_kafka_consumer_close(m_kafka_consumer.get());
    if (err) throw Exception{"Failed to close Kafka consumer: " + std::string{rd_kafka_err2str(err)}};
}

std::shared_ptr<ConsumerClientInterface> makeKafkaConsumerClient(
        const Config& config, Logger logger) {
    return std::make_shared<KafkaConsumerClient>(config, std::move(logger));
}

}
