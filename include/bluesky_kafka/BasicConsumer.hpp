/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef BLUESKY_KAFKA_BASIC_CONSUMER_HPP
#define BLUESKY_KAFKA_BASIC_CONSUMER_HPP

#include <bluesky_kafka/ForwardDcl.hpp>
#include <bluesky_kafka/BrokerClient.hpp>
#include <bluesky_kafka/Codec.hpp>
#include <bluesky_kafka/Config.hpp>
#include <bluesky_kafka/Exception.hpp>
#include <bluesky_kafka/Json.hpp>
#include <bluesky_kafka/Logging.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bluesky_kafka {

/**
 * @brief Function used by consumers to create their broker client
 * from their effective configuration.
 */
using ConsumerClientFactory = std::function<
    std::shared_ptr<ConsumerClientInterface>(const Config&, Logger)>;

/**
 * @brief A BasicConsumer polls Kafka for messages on a set of topics,
 * decodes them with a Codec (MessagePack by default), and passes them
 * to a handler, one at a time, on the thread that called start().
 *
 * A BasicConsumer can be started only once. It goes from Created to
 * Running when start() is called, and from Running (or Created) to
 * Stopped when the polling loop ends or stop() is called.
 */
class BasicConsumer {

    public:

    enum class State {
        Created,
        Running,
        Stopped
    };

    /**
     * @brief Function called with each decoded message.
     */
    using MessageHandler = std::function<void(BasicConsumer& consumer,
                                              const std::string& topic,
                                              const nlohmann::json& message)>;

    /**
     * @brief Predicate evaluated after each handled message;
     * the polling loop ends when it returns false.
     */
    using ContinuePolling = std::function<bool()>;

    static constexpr std::chrono::milliseconds DefaultPollingDuration{1000};

    /**
     * @brief Constructor. Creates the broker client and subscribes
     * to the topics; no message is polled until start() is called.
     *
     * @param topics Topics to subscribe to.
     * @param bootstrap_servers Kafka broker addresses, combined with the
     * "bootstrap.servers" of consumer_config if present.
     * @param group_id Consumer group (sets "group.id").
     * @param consumer_config librdkafka properties. "auto.offset.reset"
     * defaults to "latest".
     * @param process_message Handler called with each decoded message.
     * @param polling_duration Timeout of each poll.
     * @param codec Codec used to decode messages.
     * @param logger Logger used by this consumer.
     * @param client_factory Function creating the broker client.
     */
    BasicConsumer(std::vector<std::string> topics,
                  std::vector<std::string> bootstrap_servers,
                  std::optional<std::string> group_id,
                  Config consumer_config = Config{},
                  MessageHandler process_message = MessageHandler{},
                  std::chrono::milliseconds polling_duration = DefaultPollingDuration,
                  Codec codec = Codec{},
                  Logger logger = defaultLogger(),
                  ConsumerClientFactory client_factory = makeKafkaConsumerClient);

    BasicConsumer(const BasicConsumer&) = delete;
    BasicConsumer& operator=(const BasicConsumer&) = delete;

    /**
     * @brief Destructor. Stops the consumer if needed.
     */
    virtual ~BasicConsumer();

    /**
     * @brief Run the polling loop on the calling thread until
     * continue_polling returns false, stop() is called from a handler,
     * or an exception escapes.
     *
     * Polls that time out and messages carrying a broker error do not
     * end the loop (the latter are logged) and do not cause
     * continue_polling to be evaluated. A message that cannot be decoded
     * ends the loop with a DecodeError. In every case the consumer is
     * Stopped, and its connection released, when this function returns
     * or throws.
     *
     * @param continue_polling Predicate evaluated after each handled
     * message. If empty, the loop only ends on stop() or on error.
     *
     * @throws AlreadyStoppedError if the consumer has been stopped before.
     */
    void start(ContinuePolling continue_polling = ContinuePolling{});

    /**
     * @brief Close the connection to Kafka. The consumer cannot be
     * restarted. Calling stop() on a stopped consumer does nothing.
     */
    void stop();

    State state() const {
        return m_state;
    }

    bool closed() const {
        return m_state == State::Stopped;
    }

    const std::vector<std::string>& topics() const {
        return m_topics;
    }

    /**
     * @brief Effective configuration of the underlying consumer,
     * credentials included. Use toString() for display purposes.
     */
    const Config& config() const {
        return m_config;
    }

    std::chrono::milliseconds pollingDuration() const {
        return m_polling_duration;
    }

    const Codec& codec() const {
        return m_codec;
    }

    /**
     * @brief Human-readable description of the consumer,
     * with credentials masked.
     */
    virtual std::string toString() const;

    protected:

    /**
     * @brief Called with each decoded message. The default
     * implementation calls the handler given to the constructor.
     */
    virtual void processMessage(const std::string& topic, const nlohmann::json& message);

    std::string describe(const char* type) const;

    const Logger& logger() const {
        return m_logger;
    }

    private:

    std::vector<std::string>                 m_topics;
    Config                                   m_config;
    MessageHandler                           m_process_message;
    std::chrono::milliseconds                m_polling_duration;
    Codec                                    m_codec;
    Logger                                   m_logger;
    std::shared_ptr<ConsumerClientInterface> m_client;
    State                                    m_state = State::Created;

    void pollLoop(const ContinuePolling& continue_polling);
};

std::string to_string(BasicConsumer::State state);

}

#endif
