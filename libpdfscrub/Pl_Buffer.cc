#include <pdfscrub/Pl_Buffer.hh>

#include <stdexcept>

class Pl_Buffer::Members
{
  public:
    Members() = default;
    Members(Members const&) = delete;

    bool ready{true};
    std::string data;
};

Pl_Buffer::Pl_Buffer(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next),
    m(std::make_unique<Members>())
{
}

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
Pl_Buffer::~Pl_Buffer() = default;

void
Pl_Buffer::write(unsigned char const* buf, size_t len)
{
    if (!len) {
        return;
    }
    m->data.append(reinterpret_cast<char const*>(buf), len);
    m->ready = false;

    if (next()) {
        next()->write(buf, len);
    }
}

void
Pl_Buffer::finish()
{
    m->ready = true;
    if (next()) {
        next()->finish();
    }
}

std::string
Pl_Buffer::getString()
{
    if (!m->ready) {
        throw std::logic_error("Pl_Buffer::getString() called when not ready");
    }
    auto s = std::move(m->data);
    m->data.clear();
    return s;
}
