#include "mmsim/portfolio.hpp"

namespace mmsim {

void Portfolio::buy(double size, double price) {
  cash -= price;
  lots += size;
}

void Portfolio::sell(double size, double price) {
  cash += price;
  lots -= size;
}

} // namespace mmsim
