#include "common.hxx"
#include "signalhandler.hxx"

using namespace pgdumpctl;

JobSignalHandler::JobSignalHandler() {}

JobSignalHandler::~JobSignalHandler() {}

AtomicSignalHandler::AtomicSignalHandler() {

  this->ref_var = nullptr;
  this->ref_value = -1;

}

AtomicSignalHandler::AtomicSignalHandler(volatile sig_atomic_t *ref_var,
                                         int ref_value) {

  this->ref_var = ref_var;
  this->ref_value = ref_value;

}

AtomicSignalHandler::~AtomicSignalHandler() {}

bool AtomicSignalHandler::check() {

  if (this->ref_var != nullptr) {
    return (*(this->ref_var) == this->ref_value);
  }

  return false;
}

CancellationHandler::CancellationHandler() : JobSignalHandler(), cancelled(false) {}

CancellationHandler::~CancellationHandler() {}

void CancellationHandler::cancel() {

  this->cancelled.store(true);

}

void CancellationHandler::reset() {

  this->cancelled.store(false);

}

bool CancellationHandler::check() {

  return this->cancelled.load();

}
