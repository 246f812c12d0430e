#include <visual_chunker/document_source.h>
#include <visual_chunker/text_metrics.h>
#include <mupdf/fitz.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace visual_chunker {

class PdfDocumentSource::Impl {
public:
    Impl() {
        ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx) {
            throw std::runtime_error("Failed to create MuPDF context");
        }
        fz_register_document_handlers(ctx);
    }

    ~Impl() {
        if (ctx) {
            fz_drop_context(ctx);
        }
    }

    SourceDocument load(const std::string& pdf_path) {
        if (!std::filesystem::exists(pdf_path)) {
            throw std::runtime_error("PDF file not found: " + pdf_path);
        }

        fz_document *raw_doc = nullptr;
        int page_count = 0;
        bool opened = true;

        fz_var(raw_doc);
        fz_try(ctx) {
            raw_doc = fz_open_document(ctx, pdf_path.c_str());
            page_count = fz_count_pages(ctx, raw_doc);
        }
        fz_catch(ctx) {
            opened = false;
        }

        std::unique_ptr<fz_document, DocumentCloser> doc(raw_doc, DocumentCloser{ctx});
        if (!opened) {
            throw std::runtime_error("MuPDF error opening document: " + pdf_path);
        }

        SourceDocument source;
        source.document.name = std::filesystem::path(pdf_path).filename().string();
        source.document.type = DocumentType::paginated;

        for (int i = 0; i < page_count; ++i) {
            if (i > 0) {
                source.document.content += '\f';
            }
            if (!extract_page(doc.get(), i, source)) {
                std::cerr << "[PdfDocumentSource::load] Skipping unreadable page " << i + 1
                          << " of " << pdf_path << std::endl;
            }
        }

        return source;
    }

private:
    struct DocumentCloser {
        fz_context *ctx;
        void operator()(fz_document *doc) const {
            if (doc) fz_drop_document(ctx, doc);
        }
    };

    bool extract_page(fz_document *doc, int page_index, SourceDocument& source) {
        fz_page *page = nullptr;
        fz_stext_page *stext = nullptr;
        bool loaded = true;

        fz_var(page);
        fz_var(stext);

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_index);

            fz_stext_options opts = { 0 };
            opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE |
                         FZ_STEXT_PRESERVE_IMAGES;
            stext = fz_new_stext_page_from_page(ctx, page, &opts);
        }
        fz_catch(ctx) {
            loaded = false;
        }

        if (loaded) {
            collect_blocks(stext, page_index + 1, source);
        }

        if (stext) fz_drop_stext_page(ctx, stext);
        if (page) fz_drop_page(ctx, page);
        return loaded;
    }

    void collect_blocks(fz_stext_page *stext, int page_number, SourceDocument& source) {
        std::string page_text;
        int image_count = 0;

        for (fz_stext_block *block = stext->first_block; block; block = block->next) {
            if (block->type == FZ_STEXT_BLOCK_TEXT) {
                std::string block_text;

                for (fz_stext_line *line = block->u.t.first_line; line; line = line->next) {
                    if (!block_text.empty()) block_text += '\n';

                    for (fz_stext_char *ch = line->first_char; ch; ch = ch->next) {
                        // Convert Unicode to UTF-8
                        char utf8[8] = {0};
                        int len = fz_runetochar(utf8, ch->c);
                        block_text.append(utf8, len);
                    }
                }

                if (!trim(block_text).empty()) {
                    if (!page_text.empty()) page_text += "\n\n";
                    page_text += block_text;
                }
            } else if (block->type == FZ_STEXT_BLOCK_IMAGE) {
                VisualElement visual;
                visual.id = "page" + std::to_string(page_number) + "_image" + std::to_string(image_count++);
                visual.type = "image";
                visual.page_number = page_number;
                visual.bounding_box = BoundingBox{block->bbox.x0, block->bbox.y0,
                                                  block->bbox.x1 - block->bbox.x0,
                                                  block->bbox.y1 - block->bbox.y0};
                source.visuals.push_back(std::move(visual));
            }
        }

        source.document.content += page_text;
    }

    fz_context *ctx;
};

PdfDocumentSource::PdfDocumentSource() : pImpl(std::make_unique<Impl>()) {}
PdfDocumentSource::~PdfDocumentSource() = default;

SourceDocument PdfDocumentSource::load(const std::string& path) {
    return pImpl->load(path);
}

} // namespace visual_chunker
