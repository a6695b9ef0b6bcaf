#include "container.hpp"
#include "resolution_sink.hpp"

namespace inject {

Container::Container()
    : Container(ContainerOptions{})
{
}

Container::Container(ContainerOptions options)
    : catalog_(std::move(options.catalog)),
      sink_(std::move(options.sink))
{
    if (!catalog_) catalog_ = TypeCatalog::global();
    if (!sink_) sink_ = std::make_shared<NullSink>();
}

Container::~Container() = default;

} // namespace inject
