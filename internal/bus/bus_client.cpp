#include "internal/bus/bus_client.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"

namespace dispatch::bus {

BusClient::BusClient(std::shared_ptr<Broker> broker) : broker_(std::move(broker)) {
}

BusClient::~BusClient() {
  try {
    Disconnect();
  } catch (const std::exception& e) {
    DISPATCH_LOG_ERROR("Bus disconnect failed", {observability::ErrorField(e.what())});
  }
}

void BusClient::Connect() {
  broker_->Open();
  connected_ = true;
  DISPATCH_LOG_INFO("Connected to message bus");
}

void BusClient::Disconnect() {
  const bool was_connected = connected_.exchange(false);

  // consumers are stopped even after a failed or repeated disconnect
  std::vector<std::unique_ptr<Subscription>> subscriptions;
  {
    std::lock_guard lock(mutex_);
    subscriptions.swap(subscriptions_);
  }

  for (auto& subscription : subscriptions) {
    broker_->DeleteQueue(subscription->queue);
  }
  for (auto& subscription : subscriptions) {
    if (subscription->thread.joinable()) subscription->thread.join();
  }

  if (!was_connected) return;
  broker_->Close();
  DISPATCH_LOG_INFO("Disconnected from message bus");
}

void BusClient::RequireConnected() const {
  if (!connected_) throw util::Unavailable("message bus is not connected");
}

void BusClient::Publish(const std::string& exchange, const std::string& payload, std::optional<std::chrono::milliseconds> expiration) {
  RequireConnected();
  broker_->AssertExchange(exchange);
  broker_->Publish(exchange, payload, expiration);
}

void BusClient::PublishMessage(const std::string& exchange, const google::protobuf::Message& message,
                               std::optional<std::chrono::milliseconds> expiration) {
  Publish(exchange, util::ToJson(message), expiration);
}

void BusClient::Subscribe(const std::string& exchange, Handler handler) {
  RequireConnected();
  broker_->AssertExchange(exchange);

  auto subscription      = std::make_unique<Subscription>();
  subscription->exchange = exchange;
  subscription->queue    = broker_->DeclareQueue();
  subscription->handler  = std::move(handler);
  broker_->Bind(subscription->queue, exchange);

  const auto queue = subscription->queue;
  auto*      raw   = subscription.get();
  {
    std::lock_guard lock(mutex_);
    // Disconnect() may have run since the check above
    if (!connected_) {
      broker_->DeleteQueue(queue);
      throw util::Unavailable("message bus disconnected while subscribing to " + exchange);
    }
    raw->thread = std::thread(&BusClient::ConsumeLoop, this, std::ref(*raw));
    subscriptions_.push_back(std::move(subscription));
  }

  DISPATCH_LOG_INFO("Subscribed to exchange", {observability::ExchangeField(exchange), observability::StringField("queue", queue)});
}

void BusClient::ConsumeLoop(Subscription& subscription) {
  for (;;) {
    auto payload = broker_->Consume(subscription.queue);
    if (!payload) break;

    observability::SpanScope span("bus.consume", {observability::ExchangeField(subscription.exchange)});
    try {
      subscription.handler(*payload);
      observability::Metrics::Instance().RecordBusMessage(subscription.exchange, true);
    } catch (const std::exception& e) {
      observability::Metrics::Instance().RecordBusMessage(subscription.exchange, false);
      span.RecordError(e.what());
      DISPATCH_LOG_ERROR("Bus consumer failed",
                         {observability::ExchangeField(subscription.exchange), observability::ErrorField(e.what())});
    }
  }
}

} // namespace dispatch::bus
