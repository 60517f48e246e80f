#ifndef vector_hh_INCLUDED
#define vector_hh_INCLUDED

#include <vector>

namespace Tabgrid
{

template<typename T>
using Vector = std::vector<T>;

}

#endif // vector_hh_INCLUDED
