#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl_bind.h>
#include "mmsim/config.hpp"
#include "mmsim/matching_engine.hpp"
#include "mmsim/order.hpp"
#include "mmsim/order_book.hpp"
#include "mmsim/simulation.hpp"
#include "mmsim/simulation_result.hpp"
#include "mmsim/trade.hpp"
#include <sstream>

namespace py = pybind11;

// Bound by reference so config.noise_traders.append(...) edits the config.
PYBIND11_MAKE_OPAQUE(std::vector<mmsim::NoiseTraderConfig>)

PYBIND11_MODULE(_mmsim, m) {
  m.doc() = "Double-auction market simulator";

  py::enum_<mmsim::Side>(m, "Side")
    .value("Bid", mmsim::Side::Bid)
    .value("Ask", mmsim::Side::Ask);

  // Order
  py::class_<mmsim::Order>(m, "Order")
    .def(py::init<double, double, mmsim::Side, mmsim::TraderId>(),
         py::arg("price"), py::arg("size"), py::arg("side"), py::arg("owner"))
    .def_readonly("id", &mmsim::Order::id)
    .def_readonly("price", &mmsim::Order::price)
    .def_readonly("size", &mmsim::Order::size)
    .def_readonly("side", &mmsim::Order::side)
    .def_readonly("owner", &mmsim::Order::owner)
    .def("__str__", [](const mmsim::Order &o) {
      std::ostringstream out;
      out << o;
      return out.str();
    });

  // Trade
  py::class_<mmsim::Trade>(m, "Trade")
    .def_readonly("buyer", &mmsim::Trade::buyer)
    .def_readonly("seller", &mmsim::Trade::seller)
    .def_readonly("size", &mmsim::Trade::size)
    .def_readonly("price", &mmsim::Trade::price);

  // OrderBook
  py::class_<mmsim::OrderBook>(m, "OrderBook")
    .def(py::init<>())
    .def("insert", &mmsim::OrderBook::insert)
    .def("best_bid", &mmsim::OrderBook::best_bid)
    .def("best_ask", &mmsim::OrderBook::best_ask)
    .def("mid_price", &mmsim::OrderBook::mid_price)
    .def("cancel", py::overload_cast<mmsim::OrderId>(&mmsim::OrderBook::cancel))
    .def("amend", &mmsim::OrderBook::amend)
    .def("clear", &mmsim::OrderBook::clear)
    .def_property_readonly("bids", &mmsim::OrderBook::bids)
    .def_property_readonly("asks", &mmsim::OrderBook::asks)
    .def("__len__", &mmsim::OrderBook::size)
    .def("__str__", &mmsim::OrderBook::to_string);

  py::class_<mmsim::MidpointMatchingEngine>(m, "MatchingEngine")
    .def(py::init<>())
    .def("match", &mmsim::MidpointMatchingEngine::match);

  // DatabaseConfig
  py::class_<mmsim::DatabaseConfig>(m, "DatabaseConfig")
    .def(py::init<>())
    .def_readwrite("host", &mmsim::DatabaseConfig::host)
    .def_readwrite("port", &mmsim::DatabaseConfig::port)
    .def_readwrite("database", &mmsim::DatabaseConfig::database)
    .def_readwrite("user", &mmsim::DatabaseConfig::user)
    .def_readwrite("password", &mmsim::DatabaseConfig::password);

  // ReplayConfig
  py::class_<mmsim::ReplayConfig>(m, "ReplayConfig")
    .def(py::init<>())
    .def_readwrite("db_config", &mmsim::ReplayConfig::db_config)
    .def_readwrite("table", &mmsim::ReplayConfig::table)
    .def_readwrite("start_ts", &mmsim::ReplayConfig::start_ts)
    .def_readwrite("end_ts", &mmsim::ReplayConfig::end_ts);

  py::class_<mmsim::MarketMakerConfig>(m, "MarketMakerConfig")
    .def(py::init<>())
    .def_readwrite("markup", &mmsim::MarketMakerConfig::markup)
    .def_readwrite("size", &mmsim::MarketMakerConfig::size)
    .def_readwrite("cash", &mmsim::MarketMakerConfig::cash)
    .def_readwrite("lots", &mmsim::MarketMakerConfig::lots);

  py::class_<mmsim::NoiseTraderConfig>(m, "NoiseTraderConfig")
    .def(py::init<>())
    .def_readwrite("size", &mmsim::NoiseTraderConfig::size)
    .def_readwrite("volatility", &mmsim::NoiseTraderConfig::volatility)
    .def_readwrite("cash", &mmsim::NoiseTraderConfig::cash)
    .def_readwrite("lots", &mmsim::NoiseTraderConfig::lots);

  py::bind_vector<std::vector<mmsim::NoiseTraderConfig>>(m, "NoiseTraderConfigList");

  // SimulationConfig
  py::class_<mmsim::SimulationConfig>(m, "SimulationConfig")
    .def(py::init<>())
    .def_readwrite("ticks", &mmsim::SimulationConfig::ticks)
    .def_readwrite("initial_price", &mmsim::SimulationConfig::initial_price)
    .def_readwrite("drift", &mmsim::SimulationConfig::drift)
    .def_readwrite("volatility", &mmsim::SimulationConfig::volatility)
    .def_readwrite("seed", &mmsim::SimulationConfig::seed)
    .def_readwrite("market_maker", &mmsim::SimulationConfig::market_maker)
    .def_readwrite("noise_traders", &mmsim::SimulationConfig::noise_traders)
    .def_readwrite("tracked_trader", &mmsim::SimulationConfig::tracked_trader);

  // SimulationResult
  py::class_<mmsim::SimulationResult>(m, "SimulationResult")
    .def(py::init<>())
    .def_readwrite("ticks", &mmsim::SimulationResult::ticks)
    .def_readwrite("prices", &mmsim::SimulationResult::prices)
    .def_readwrite("portfolio_value", &mmsim::SimulationResult::portfolio_value)
    .def_readwrite("pnl", &mmsim::SimulationResult::pnl)
    .def_readwrite("drawdown", &mmsim::SimulationResult::drawdown)
    .def_readwrite("trades", &mmsim::SimulationResult::trades)
    .def_readwrite("volume", &mmsim::SimulationResult::volume)
    .def_readwrite("bankrupt", &mmsim::SimulationResult::bankrupt)
    .def_readwrite("bankruptcy_tick", &mmsim::SimulationResult::bankruptcy_tick);

  // Main simulation functions
  m.def("simulate", &mmsim::simulate,
        "Run a random-walk simulation from config", py::arg("config"));
  m.def("simulate_replay", &mmsim::simulate_replay,
        "Run a simulation over stored close prices", py::arg("config"),
        py::arg("replay"));
}
