#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include "app/Config.hpp"
#include "app/Http.hpp"
#include "app/Scheduler.hpp"
#include "engine/AlertManager.hpp"
#include "engine/ReleaseGate.hpp"
#include "store/IStore.hpp"

namespace sloguard::app {

// Transport-free REST handler. Routes are accepted with or without the
// configured API prefix; every exception maps to a JSON error body.
class ApiRouter {
public:
  using ClockFn = std::function<sloguard::model::Timestamp()>;

  ApiRouter(sloguard::store::IStore& store, Scheduler& scheduler, sloguard::engine::ReleaseGate& gate,
            sloguard::engine::AlertManager& alerts, const Config& config, ClockFn clock = {});

  [[nodiscard]] HttpResponse handle(const HttpRequest& req);

private:
  using Segments = std::vector<std::string_view>;

  HttpResponse route(const HttpRequest& req, const Segments& seg);

  HttpResponse health();
  HttpResponse services(const HttpRequest& req, const Segments& seg);
  HttpResponse slo(const HttpRequest& req, const Segments& seg);
  HttpResponse burn(const HttpRequest& req, const Segments& seg);
  HttpResponse forecast(const HttpRequest& req, const Segments& seg);
  HttpResponse release(const HttpRequest& req, const Segments& seg);
  HttpResponse summary(const HttpRequest& req, const Segments& seg);
  HttpResponse alerts(const HttpRequest& req, const Segments& seg);
  HttpResponse acknowledge_bulk(const HttpRequest& req);
  HttpResponse metrics(const HttpRequest& req, const Segments& seg);

  void require_service(const std::string& name) const;
  [[nodiscard]] sloguard::model::Timestamp now() const;
  [[nodiscard]] size_t forecast_points() const;

  sloguard::store::IStore& store_;
  Scheduler& scheduler_;
  sloguard::engine::ReleaseGate& gate_;
  sloguard::engine::AlertManager& alerts_;
  const Config& config_;
  ClockFn clock_;
};

} // namespace sloguard::app
