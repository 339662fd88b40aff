#pragma once

#include "core/transformation_adapter.hpp"

/**
 * @brief Merges PDF documents in submission order using qpdf
 */
class PdfAdapter : public TransformationAdapter
{
public:
    std::string name() const override { return "qpdf"; }
    bool supports(OperationKind kind) const override { return kind == OperationKind::PDF_MERGE; }

    Artifact execute(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                     const TransformContext &context) override;
};
