#include "exception.hh"

#include <typeinfo>

namespace Tabgrid
{

StringView exception::what() const
{
    return typeid(*this).name();
}

}
