/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_DOCUMENT_CONSUMER_HPP
#define BLUESKY_KAFKA_DOCUMENT_CONSUMER_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/BasicConsumer.hpp>

#include <functional>
#include <string>

namespace bluesky_kafka {

/**
 * @brief A DocumentConsumer is a BasicConsumer for messages produced
 * by a Publisher: each message must decode into a [name, document]
 * array, and the name and document are passed to the handler separately.
 * A message of any other shape ends the polling loop with a DecodeError.
 */
class DocumentConsumer : public BasicConsumer {

    public:

    using DocumentHandler = std::function<void(DocumentConsumer& consumer,
                                               const std::string& topic,
                                               const std::string& name,
                                               const nlohmann::json& document)>;

    /**
     * @brief Constructor.
     *
     * @see BasicConsumer::BasicConsumer
     *
     * @param process_document Handler called with each document.
     */
    DocumentConsumer(std::vector<std::string> topics,
                     std::vector<std::string> bootstrap_servers,
                     std::optional<std::string> group_id,
                     Config consumer_config = Config{},
                     DocumentHandler process_document = DocumentHandler{},
                     std::chrono::milliseconds polling_duration = DefaultPollingDuration,
                     Codec codec = Codec{},
                     Logger logger = defaultLogger(),
                     ConsumerClientFactory client_factory = makeKafkaConsumerClient);

    std::string toString() const override;

    protected:

    void processMessage(const std::string& topic, const nlohmann::json& message) override;

    /**
     * @brief Called with each document. The default implementation
     * calls the handler given to the constructor.
     */
    virtual void processDocument(const std::string& topic,
                                 const std::string& name,
                                 const nlohmann::json& document);

    private:

    DocumentHandler m_process_document;
};

}

#endif
