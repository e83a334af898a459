#include <raster_ql/storage/catalog.h>
#include <raster_ql/storage/file_catalog.h>

namespace raster_ql {

arrow::Result<std::shared_ptr<LayerCatalog>> OpenCatalog(const std::string& uri) {
    static const std::string kFileScheme = "file://";

    std::string path;
    if (uri.rfind(kFileScheme, 0) == 0) {
        path = uri.substr(kFileScheme.size());
    } else if (uri.find("://") != std::string::npos) {
        return arrow::Status::NotImplemented("Unsupported catalog URI scheme: ", uri);
    } else {
        path = uri;
    }
    if (path.empty()) {
        return arrow::Status::Invalid("Catalog URI has no path: '", uri, "'");
    }

    auto catalog = std::make_shared<LayerCatalog>();
    catalog->uri = uri;
    catalog->attribute_store = std::make_shared<FileAttributeStore>(path);
    catalog->layer_reader = std::make_shared<FileLayerReader>(path, catalog->attribute_store);
    return catalog;
}

} // namespace raster_ql
