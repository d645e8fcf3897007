#ifndef __INPUT_HPP__
#define __INPUT_HPP__

// Maps the number keys 2, 3 and 4 to a dimension, anything else to 0.
int KeyToDimension(int key);

#endif // __INPUT_HPP__
