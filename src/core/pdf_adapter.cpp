#include "core/pdf_adapter.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <memory>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>

Artifact PdfAdapter::execute(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                             const TransformContext &context)
{
    if (spec.kind != OperationKind::PDF_MERGE)
    {
        throw TransformFailed("qpdf cannot perform " + OperationKinds::getName(spec.kind));
    }
    if (inputs.empty())
    {
        throw TransformFailed("No input to process");
    }
    context.checkpoint();

    const auto output = context.workspace.resolve("merged.pdf");
    size_t page_count = 0;

    try
    {
        QPDF merged;
        merged.emptyPDF();
        QPDFPageDocumentHelper merged_pages(merged);

        // Pages reference objects of their source document until the writer has run
        std::vector<std::unique_ptr<QPDF>> sources;
        sources.reserve(inputs.size());

        for (const auto &input : inputs)
        {
            auto source = std::make_unique<QPDF>();
            source->setSuppressWarnings(true);
            try
            {
                source->processFile(input.path.string().c_str());
            }
            catch (const QPDFExc &e)
            {
                throw TransformFailed("Cannot read " + input.display_name + ": " + e.getMessageDetail());
            }

            for (auto &page : QPDFPageDocumentHelper(*source).getAllPages())
            {
                merged_pages.addPage(page, false);
                ++page_count;
            }
            sources.push_back(std::move(source));
            context.checkpoint();
        }

        QPDFWriter writer(merged, output.string().c_str());
        writer.write();
    }
    catch (const QPDFExc &e)
    {
        throw TransformFailed(e.getMessageDetail());
    }

    Logger::debug("Merged " + std::to_string(inputs.size()) + " PDF(s) into " + std::to_string(page_count) +
                  " page(s)");
    return makeArtifact(output, "application/pdf", "merged.pdf");
}
