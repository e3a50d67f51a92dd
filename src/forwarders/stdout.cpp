#include "stdout.hpp"
#include "record_fields.hpp"

namespace smsrelay {

StdoutForwarder StdoutForwarder::from_json(const ConfigJson& record) {
    unwrap_record(record, kTag);
    return StdoutForwarder();
}

bool StdoutForwarder::forward(const SmsMessage& sms, HttpClient& /*http*/) const {
    *out_ << "Received an sms from " << sms.sender << " at " << sms.timestamp
          << ": " << sms.body << "\n";
    out_->flush();
    return true;
}

} // namespace smsrelay
