#include "alphabet.hpp"
#include "editdist.hpp"
#include "vector.hpp"

// edit_distance is implemented using a straight forward dynamic
// programming algorithm with out any special tricks.

namespace lexdist {

  using lcommon::Vector;

  double edit_distance(ParmString a0, ParmString b0,
                       const PhoneticWeights & w) 
  {
    const Alphabet & alpha = asjp_alphabet();
    int a_size = a0.size() + 1;
    int b_size = b0.size() + 1;
    // e[i + j*a_size] is the distance between the first i symbols of
    // a and the first j symbols of b
    Vector<double> e(a_size * b_size);
#define E(i,j) e[(i) + (j)*a_size]
    E(0, 0) = 0;
    for (int j = 1; j != b_size; ++j)
      E(0, j) = E(0, j-1) + w.del2;
    const char * a = a0.c_str();
    const char * b = b0.c_str();
    double te;
    for (int i = 1; i != a_size; ++i) {
      E(i, 0) = E(i-1, 0) + w.del1;
      for (int j = 1; j != b_size; ++j) {
        char x = a[i-1];
        char y = b[j-1];

        if (x == y)
          E(i, j) = E(i-1, j-1);
        else if (alpha.is_vowel(x) && alpha.is_vowel(y))
          E(i, j) = w.vowel_sub + E(i-1, j-1);
        else
          E(i, j) = w.sub + E(i-1, j-1);

        te = w.del1 + E(i-1, j);
        if (te < E(i, j)) E(i, j) = te;
        te = w.del2 + E(i, j-1);
        if (te < E(i, j)) E(i, j) = te;
      } 
    }
    double res = E(a_size-1, b_size-1);
#undef E
    return res;
  }

  double edit_distance(ParmString a, ParmString b, double vowel_weight)
  {
    return edit_distance(a, b, PhoneticWeights(vowel_weight));
  }
}
