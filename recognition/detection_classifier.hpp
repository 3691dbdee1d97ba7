#pragma once

#include <string>

#include "classifier.hpp"
#include "../net/http_client.hpp"

namespace sorter {

enum class detection_mode {
    model,      // hosted model endpoint, base64 form body
    workflow,   // workflow endpoint, JSON body
};

struct detection_classifier_options {
    std::string endpoint;
    std::string api_key;
    detection_mode mode = detection_mode::model;
};

/**
 * @brief Object detection service (Roboflow style)
 *
 * The response layout depends on the deployment mode, so the label comes
 * from the highest-confidence prediction found anywhere in the reply.
 */
class detection_classifier : public iclassifier {
public:
    detection_classifier(ihttp_client& http, detection_classifier_options options);

    classifier_verdict classify(const std::vector<uint8_t>& jpeg) override;

    std::string name() const override { return "detection"; }

private:
    http_request build_request(const std::vector<uint8_t>& jpeg) const;

    ihttp_client& m_http;
    detection_classifier_options m_options;
};

} // namespace sorter
