#include "mmsim/postgres_prices.hpp"
#include <libpq-fe.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace mmsim {

std::string connection_string(const DatabaseConfig &config) {
  std::string conninfo = "host=" + config.host +
                         " port=" + std::to_string(config.port) +
                         " dbname=" + config.database;
  if (!config.user.empty()) {
    conninfo += " user=" + config.user;
  }
  if (!config.password.empty()) {
    conninfo += " password=" + config.password;
  }
  return conninfo;
}

PostgresPriceReplay::PostgresPriceReplay(const ReplayConfig &config) {
  PGconn *conn = PQconnectdb(connection_string(config.db_config).c_str());

  if (PQstatus(conn) != CONNECTION_OK) {
    std::string message = "Connection failed: ";
    message += PQerrorMessage(conn);
    PQfinish(conn);
    throw std::runtime_error(message);
  }

  char *table = PQescapeIdentifier(conn, config.table.c_str(),
                                   config.table.size());
  if (table == nullptr) {
    std::string message = "Invalid table name: ";
    message += PQerrorMessage(conn);
    PQfinish(conn);
    throw std::runtime_error(message);
  }
  const std::string query = std::string("SELECT close FROM ") + table +
                            " WHERE ts >= $1 AND ts <= $2 ORDER BY ts ASC";
  PQfreemem(table);

  const std::string start = std::to_string(config.start_ts);
  const std::string end = std::to_string(config.end_ts);
  const char *params[2] = {start.c_str(), end.c_str()};

  PGresult *res = PQexecParams(conn, query.c_str(), 2, nullptr, params,
                               nullptr, nullptr, 0);

  if (PQresultStatus(res) != PGRES_TUPLES_OK) {
    std::string message = "Query failed: ";
    message += PQerrorMessage(conn);
    PQclear(res);
    PQfinish(conn);
    throw std::runtime_error(message);
  }

  const int rows = PQntuples(res);
  if (rows == 0) {
    PQclear(res);
    PQfinish(conn);
    throw std::runtime_error("No rows returned");
  }

  closes_.reserve(static_cast<std::size_t>(rows));
  try {
    for (int row = 0; row < rows; ++row) {
      closes_.push_back(std::stod(PQgetvalue(res, row, 0)));
    }
  } catch (...) {
    PQclear(res);
    PQfinish(conn);
    throw;
  }

  PQclear(res);
  PQfinish(conn);
}

PostgresPriceReplay::PostgresPriceReplay(std::vector<double> closes)
    : closes_(std::move(closes)) {
  if (closes_.empty()) {
    throw std::invalid_argument("Price replay needs at least one close");
  }
}

bool PostgresPriceReplay::next() {
  if (!started_) {
    started_ = true;
    return true;
  }
  if (index_ + 1 >= closes_.size()) {
    return false;
  }
  ++index_;
  return true;
}

double PostgresPriceReplay::price() const { return closes_[index_]; }

} // namespace mmsim
