#pragma once

#include "lendswap/custody/i_transaction_host.hpp"
#include "lendswap/domain/error.hpp"

#include <iostream>
#include <string>

namespace lendswap {

// -----------------------------------------------------------------------------
// runAtomically(host, component, operation, body)
// -----------------------------------------------------------------------------
//
// @brief  The operation boundary shared by PositionManager and
//         ReserveManager.
//
// @details
// Opens a host transaction, runs `body`, and commits. If `body` throws a
// ProtocolError or ArithmeticFault the transaction is rolled back, the
// failure is logged once to std::cerr and returned as an OperationResult
// (InternalFault for arithmetic faults). Any other exception rolls back and
// propagates unchanged.
//
// `body` must work on copies of the records and write them back as its last
// step, so that a throw anywhere leaves the caller's records untouched.
// -----------------------------------------------------------------------------
template <typename Body>
domain::OperationResult runAtomically(ITransactionHost& host,
                                      const char* component,
                                      const std::string& operation,
                                      Body&& body) {
  host.begin();
  try {
    body();
  } catch (const domain::ProtocolError& e) {
    host.rollback();
    std::cerr << "[" << component << "] " << operation << " rejected: "
              << domain::errorCodeToString(e.code()) << " (" << e.what()
              << ")\n";
    return domain::OperationResult::failure(e.code(), e.what());
  } catch (const domain::ArithmeticFault& e) {
    host.rollback();
    std::cerr << "[" << component << "] " << operation
              << " aborted on internal fault: " << e.what() << "\n";
    return domain::OperationResult::failure(domain::ErrorCode::InternalFault,
                                            e.what());
  } catch (...) {
    host.rollback();
    throw;
  }
  host.commit();
  return domain::OperationResult::success();
}

}  // namespace lendswap
